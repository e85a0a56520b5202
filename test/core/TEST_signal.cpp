#include <csignal>

#include <gtest/gtest.h>

#include "canopy/core/signal.hpp"

namespace canopy::core::test {

class SignalManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(SignalManager::instance().install_handlers().has_value());
    SignalManager::instance().clear_interrupt();
  }

  void TearDown() override {
    SignalManager::instance().clear_interrupt();
    SignalManager::instance().clear_foreground_process();
    ASSERT_TRUE(SignalManager::instance().reset_handlers().has_value());
  }
};

TEST_F(SignalManagerTest, SetAndClearForegroundProcess) {
  SignalManager::instance().set_foreground_process(12345);
  EXPECT_EQ(SignalManager::instance().get_foreground_process(), 12345);

  SignalManager::instance().clear_foreground_process();
  EXPECT_EQ(SignalManager::instance().get_foreground_process(), 0);
}

TEST_F(SignalManagerTest, SigintSetsInterruptFlag) {
  EXPECT_FALSE(SignalManager::instance().interrupted());

  ::raise(SIGINT);

  EXPECT_TRUE(SignalManager::instance().interrupted());
  SignalManager::instance().clear_interrupt();
  EXPECT_FALSE(SignalManager::instance().interrupted());
}

TEST_F(SignalManagerTest, RaiseInterruptWithoutSignal) {
  SignalManager::instance().raise_interrupt();
  EXPECT_TRUE(SignalManager::instance().interrupted());
}

} // namespace canopy::core::test
