#include "canopy/cli/app.hpp"

int main(int argc, char* argv[]) {
  return canopy::cli::run(argc, argv);
}
