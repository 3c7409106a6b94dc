#include "floodgate/internal/lifecycle.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace floodgate::internal {

TEST(LifecycleTest, StartsIdle) {
  Lifecycle lifecycle;

  EXPECT_TRUE(lifecycle.isIdle());
  EXPECT_FALSE(lifecycle.isActive());
  EXPECT_FALSE(lifecycle.hasDeadline());
}

TEST(LifecycleTest, StopOnIdleIsNoop) {
  Lifecycle lifecycle;

  EXPECT_EQ(lifecycle.exchangeStopping(), Lifecycle::State::Idle);
  EXPECT_TRUE(lifecycle.isIdle());
}

TEST(LifecycleTest, StopFromRunning) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();

  EXPECT_EQ(lifecycle.exchangeStopping(), Lifecycle::State::Running);
  EXPECT_TRUE(lifecycle.isStopping());
  EXPECT_TRUE(lifecycle.isActive());

  // Already stopping
  EXPECT_EQ(lifecycle.exchangeStopping(), Lifecycle::State::Stopping);
}

TEST(LifecycleTest, ResetClearsState) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();
  lifecycle.requestDrain(std::chrono::seconds(10));
  ASSERT_TRUE(lifecycle.applyDrainRequest());

  lifecycle.reset();

  EXPECT_TRUE(lifecycle.isIdle());
  EXPECT_FALSE(lifecycle.hasDeadline());
  EXPECT_EQ(lifecycle.deadline().time_since_epoch().count(), 0);
  EXPECT_FALSE(lifecycle.applyDrainRequest());
}

TEST(LifecycleTest, DrainWithoutDeadline) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();

  EXPECT_FALSE(lifecycle.applyDrainRequest());

  lifecycle.requestDrain(std::chrono::milliseconds{0});
  EXPECT_TRUE(lifecycle.isRunning());
  EXPECT_TRUE(lifecycle.applyDrainRequest());
  EXPECT_TRUE(lifecycle.isDraining());
  EXPECT_FALSE(lifecycle.hasDeadline());

  // Consumed
  EXPECT_FALSE(lifecycle.applyDrainRequest());
}

TEST(LifecycleTest, LaterDrainRequestOnlyShrinksDeadline) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();

  const auto before = SteadyClock::now();
  lifecycle.requestDrain(std::chrono::seconds(5));
  ASSERT_TRUE(lifecycle.applyDrainRequest());
  ASSERT_TRUE(lifecycle.hasDeadline());
  const auto firstDeadline = lifecycle.deadline();
  EXPECT_GE(firstDeadline, before + std::chrono::seconds(5));

  lifecycle.requestDrain(std::chrono::seconds(60));
  ASSERT_TRUE(lifecycle.applyDrainRequest());
  EXPECT_EQ(lifecycle.deadline(), firstDeadline);

  lifecycle.requestDrain(std::chrono::milliseconds(1));
  ASSERT_TRUE(lifecycle.applyDrainRequest());
  EXPECT_LT(lifecycle.deadline(), firstDeadline);
  EXPECT_TRUE(lifecycle.isDraining());
}

TEST(LifecycleTest, DrainRequestIgnoredWhenStopping) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();
  lifecycle.exchangeStopping();

  lifecycle.requestDrain(std::chrono::seconds(1));
  EXPECT_FALSE(lifecycle.applyDrainRequest());
  EXPECT_TRUE(lifecycle.isStopping());
  EXPECT_FALSE(lifecycle.hasDeadline());
}

TEST(LifecycleTest, StopFromDraining) {
  Lifecycle lifecycle;
  lifecycle.enterRunning();
  lifecycle.requestDrain(std::chrono::milliseconds{0});
  ASSERT_TRUE(lifecycle.applyDrainRequest());

  EXPECT_EQ(lifecycle.exchangeStopping(), Lifecycle::State::Draining);
  EXPECT_TRUE(lifecycle.isStopping());
}

}  // namespace floodgate::internal
