#include "karics/signal-handler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

namespace karics {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, RaiseSetsStopRequest) {
  SignalHandler::Enable(std::chrono::milliseconds{1234});
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::GetMaxDrainPeriod(), std::chrono::milliseconds{1234});

  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGTERM);

  SignalHandler::ResetStopRequest();
  EXPECT_FALSE(SignalHandler::IsStopRequested());
}

TEST_F(SignalHandlerTest, SigintAlsoRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGINT);
}

TEST_F(SignalHandlerTest, NoSignalNoStopRequest) {
  SignalHandler::Enable();
  EXPECT_EQ(SignalHandler::ReceivedSignal(), 0);
  EXPECT_FALSE(SignalHandler::IsStopRequested());
}

}  // namespace karics
