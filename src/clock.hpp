#pragma once

#include "context.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

namespace capsule {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = SteadyClock::duration;

class Timer {
 public:
  virtual ~Timer() = default;

  // Returns false if the timer already fired or was stopped.
  virtual bool Stop() = 0;
  virtual Signal* Fired() = 0;
};

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
  // Runs `fn` (may be empty) and fires the timer's signal once `d` has
  // elapsed. A non-positive duration fires before returning.
  virtual std::shared_ptr<Timer> AfterFunc(Duration d, std::function<void()> fn) = 0;

  std::shared_ptr<Timer> After(Duration d) { return AfterFunc(d, nullptr); }
};

class TimerQueue;

class RealClock : public Clock {
 public:
  RealClock();
  ~RealClock() override;
  RealClock(const RealClock&) = delete;
  RealClock& operator=(const RealClock&) = delete;

  TimePoint Now() const override;
  std::shared_ptr<Timer> AfterFunc(Duration d, std::function<void()> fn) override;

 private:
  void Run();

  std::shared_ptr<TimerQueue> queue_;
  std::thread worker_;
};

// Process-wide real clock shared by managers constructed without one.
std::shared_ptr<Clock> DefaultClock();

// Manually advanced clock for tests. Timers fire on the thread calling
// Advance().
class FakeClock : public Clock {
 public:
  FakeClock();
  ~FakeClock() override;

  TimePoint Now() const override;
  std::shared_ptr<Timer> AfterFunc(Duration d, std::function<void()> fn) override;

  void Advance(Duration d);
  size_t PendingTimers() const;
  // Waits (in real time) until at least `n` timers are pending.
  bool BlockUntilTimers(size_t n, std::chrono::milliseconds real_timeout) const;

 private:
  std::shared_ptr<TimerQueue> queue_;
};

}  // namespace capsule
