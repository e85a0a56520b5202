#pragma once

#include <string_view>

namespace canopy::core::constant {

inline constexpr std::string_view EXE_NAME = "canopy";
inline constexpr std::string_view EXE_DESC = "multi-repository workspace orchestrator";
inline constexpr std::string_view VERSION  = "v0.1.0";

inline constexpr std::string_view CONFIG_FILE_NAME = "canopy.yaml";
inline constexpr std::string_view CONFIG_SECTION   = "canopy";
inline constexpr std::string_view DEFAULT_SHELL    = "sh";
inline constexpr std::string_view DEFAULT_ROOT     = "${CANOPY_CONFIG_DIR}";

inline constexpr std::string_view TREE_NAME_VAR  = "TREE_NAME";
inline constexpr std::string_view TREE_PATH_VAR  = "TREE_PATH";
inline constexpr std::string_view ROOT_VAR       = "CANOPY_ROOT";
inline constexpr std::string_view CONFIG_DIR_VAR = "CANOPY_CONFIG_DIR";

inline constexpr std::string_view HOME = "HOME";

// Separator used by prepend/append environment entries
inline constexpr char PATH_SEPARATOR = ':';

} // namespace canopy::core::constant
