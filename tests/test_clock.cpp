#include <gtest/gtest.h>

#include "clock.hpp"

#include <atomic>
#include <chrono>

using namespace capsule;

class FakeClockTest : public ::testing::Test {
 protected:
  FakeClock clock;
};

TEST_F(FakeClockTest, TimerFiresOnlyWhenDeadlineReached) {
  int calls = 0;
  auto timer = clock.AfterFunc(std::chrono::milliseconds(100), [&] { calls++; });
  EXPECT_EQ(clock.PendingTimers(), 1u);

  clock.Advance(std::chrono::milliseconds(99));
  EXPECT_EQ(calls, 0);
  EXPECT_FALSE(timer->Fired()->Fired());

  clock.Advance(std::chrono::milliseconds(1));
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(timer->Fired()->Fired());
  EXPECT_EQ(clock.PendingTimers(), 0u);
}

TEST_F(FakeClockTest, StoppedTimerNeverFires) {
  auto timer = clock.After(std::chrono::milliseconds(10));
  EXPECT_TRUE(timer->Stop());
  EXPECT_FALSE(timer->Stop());
  clock.Advance(std::chrono::seconds(1));
  EXPECT_FALSE(timer->Fired()->Fired());
}

TEST_F(FakeClockTest, StopAfterFireReturnsFalse) {
  auto timer = clock.After(std::chrono::milliseconds(10));
  clock.Advance(std::chrono::milliseconds(10));
  EXPECT_FALSE(timer->Stop());
}

TEST_F(FakeClockTest, NonPositiveDurationFiresImmediately) {
  auto timer = clock.After(std::chrono::milliseconds(0));
  EXPECT_TRUE(timer->Fired()->Fired());
  EXPECT_EQ(clock.PendingTimers(), 0u);
}

TEST_F(FakeClockTest, AdvanceMovesNow) {
  const auto before = clock.Now();
  clock.Advance(std::chrono::seconds(3));
  EXPECT_EQ(clock.Now() - before, std::chrono::seconds(3));
}

TEST_F(FakeClockTest, BlockUntilTimersTimesOut) {
  EXPECT_FALSE(clock.BlockUntilTimers(1, std::chrono::milliseconds(20)));
  auto timer = clock.After(std::chrono::seconds(1));
  EXPECT_TRUE(clock.BlockUntilTimers(1, std::chrono::milliseconds(20)));
}

TEST(RealClockTest, TimerFiresAfterDuration) {
  RealClock clock;
  std::atomic<int> calls{0};
  const auto begin = SteadyClock::now();
  auto timer = clock.AfterFunc(std::chrono::milliseconds(20), [&] { calls++; });
  WaitAny({timer->Fired()});
  EXPECT_EQ(calls.load(), 1);
  EXPECT_GE(SteadyClock::now() - begin, std::chrono::milliseconds(20));
}

TEST(RealClockTest, EarlierTimerFiresFirst) {
  RealClock clock;
  auto slow = clock.After(std::chrono::seconds(30));
  auto fast = clock.After(std::chrono::milliseconds(10));
  EXPECT_EQ(WaitAny({slow->Fired(), fast->Fired()}), 1u);
  EXPECT_TRUE(slow->Stop());
}
