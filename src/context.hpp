#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capsule {

class Clock;
class Timer;

class Waker {
 public:
  void Notify();
  // Blocks until Notify() was called since the previous Wait() returned.
  void Wait();

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool notified_ = false;
};

// One-shot event. Once fired it stays fired; Fire() is idempotent.
class Signal {
 public:
  Signal() = default;
  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  void Fire();
  bool Fired() const;

  void Subscribe(const std::shared_ptr<Waker>& waker);
  void Unsubscribe(const Waker* waker);

 private:
  mutable std::mutex mu_;
  bool fired_ = false;
  std::vector<std::shared_ptr<Waker>> wakers_;
};

// Blocks until one of the signals has fired. Returns the index of the first
// fired signal in argument order, so earlier entries win ties.
size_t WaitAny(const std::vector<Signal*>& signals);

enum class ContextErr {
  kNone,
  kCanceled,
  kDeadlineExceeded,
};

// Cancellation handle shared by copies. A context is done once it is
// cancelled or its deadline timer fires, whichever happens first.
class Context {
 public:
  Context();

  static Context Background();
  static Context WithCancel();
  static Context WithTimeout(const std::shared_ptr<Clock>& clock, std::chrono::milliseconds timeout);

  void Cancel() const;
  bool IsDone() const;
  ContextErr Err() const;
  std::string ErrString() const;

  Signal* Done() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

}  // namespace capsule
