#include "floodgate/signal-handler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

namespace floodgate {

class SignalHandlerGlobalTest : public ::testing::Test {
 protected:
  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerGlobalTest, StopRequestedAfterSigterm) {
  SignalHandler::Enable(std::chrono::milliseconds{1234});
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::GetMaxDrainPeriod(), std::chrono::milliseconds{1234});

  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());

  SignalHandler::ResetStopRequest();
  EXPECT_FALSE(SignalHandler::IsStopRequested());
}

TEST_F(SignalHandlerGlobalTest, SigpipeIsIgnored) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGPIPE), 0);
  EXPECT_FALSE(SignalHandler::IsStopRequested());
}

}  // namespace floodgate
