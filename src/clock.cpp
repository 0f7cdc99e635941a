#include "clock.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace capsule {

class TimerQueue : public std::enable_shared_from_this<TimerQueue> {
 public:
  class Entry : public Timer {
   public:
    Entry(std::weak_ptr<TimerQueue> queue, TimePoint deadline, std::function<void()> fn)
        : queue_(std::move(queue)), deadline_(deadline), fn_(std::move(fn)) {}

    bool Stop() override {
      auto q = queue_.lock();
      if (!q) return false;
      return q->Cancel(this);
    }

    Signal* Fired() override { return &fired_; }

    void Run() {
      if (fn_) fn_();
      fired_.Fire();
    }

   private:
    friend class TimerQueue;
    std::weak_ptr<TimerQueue> queue_;
    TimePoint deadline_;
    std::function<void()> fn_;
    Signal fired_;
    bool done_ = false;
  };

  std::shared_ptr<Timer> Schedule(TimePoint deadline, std::function<void()> fn) {
    auto e = std::make_shared<Entry>(weak_from_this(), deadline, std::move(fn));
    {
      std::lock_guard<std::mutex> lock(mu_);
      entries_.emplace(deadline, e);
    }
    changed_.notify_all();
    return e;
  }

  bool Cancel(Entry* e) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (e->done_) return false;
      e->done_ = true;
      auto range = entries_.equal_range(e->deadline_);
      for (auto it = range.first; it != range.second; ++it) {
        if (it->second.get() == e) {
          entries_.erase(it);
          break;
        }
      }
    }
    changed_.notify_all();
    return true;
  }

  // Requires mu_.
  std::vector<std::shared_ptr<Entry>> TakeDueLocked(TimePoint now) {
    std::vector<std::shared_ptr<Entry>> due;
    while (!entries_.empty() && entries_.begin()->first <= now) {
      auto e = entries_.begin()->second;
      entries_.erase(entries_.begin());
      e->done_ = true;
      due.push_back(std::move(e));
    }
    return due;
  }

  static void RunAll(const std::vector<std::shared_ptr<Entry>>& due) {
    for (const auto& e : due) e->Run();
  }

  std::mutex mu_;
  std::condition_variable changed_;
  std::multimap<TimePoint, std::shared_ptr<Entry>> entries_;
  bool shutdown_ = false;
  TimePoint fake_now_{};
};

RealClock::RealClock() : queue_(std::make_shared<TimerQueue>()) {
  worker_ = std::thread([this] { Run(); });
}

RealClock::~RealClock() {
  {
    std::lock_guard<std::mutex> lock(queue_->mu_);
    queue_->shutdown_ = true;
  }
  queue_->changed_.notify_all();
  if (worker_.joinable()) worker_.join();
}

TimePoint RealClock::Now() const {
  return SteadyClock::now();
}

std::shared_ptr<Timer> RealClock::AfterFunc(Duration d, std::function<void()> fn) {
  auto timer = queue_->Schedule(Now() + d, std::move(fn));
  if (d <= Duration::zero()) {
    std::vector<std::shared_ptr<TimerQueue::Entry>> due;
    {
      std::lock_guard<std::mutex> lock(queue_->mu_);
      due = queue_->TakeDueLocked(Now());
    }
    TimerQueue::RunAll(due);
  }
  return timer;
}

void RealClock::Run() {
  std::unique_lock<std::mutex> lock(queue_->mu_);
  while (!queue_->shutdown_) {
    if (queue_->entries_.empty()) {
      queue_->changed_.wait(lock);
      continue;
    }
    const auto next = queue_->entries_.begin()->first;
    if (SteadyClock::now() < next) {
      queue_->changed_.wait_until(lock, next);
      continue;
    }
    auto due = queue_->TakeDueLocked(SteadyClock::now());
    lock.unlock();
    TimerQueue::RunAll(due);
    lock.lock();
  }
}

std::shared_ptr<Clock> DefaultClock() {
  static std::shared_ptr<Clock> clock = std::make_shared<RealClock>();
  return clock;
}

FakeClock::FakeClock() : queue_(std::make_shared<TimerQueue>()) {
  queue_->fake_now_ = TimePoint{} + std::chrono::hours(1);
}

FakeClock::~FakeClock() = default;

TimePoint FakeClock::Now() const {
  std::lock_guard<std::mutex> lock(queue_->mu_);
  return queue_->fake_now_;
}

std::shared_ptr<Timer> FakeClock::AfterFunc(Duration d, std::function<void()> fn) {
  auto timer = queue_->Schedule(Now() + d, std::move(fn));
  if (d <= Duration::zero()) {
    std::vector<std::shared_ptr<TimerQueue::Entry>> due;
    {
      std::lock_guard<std::mutex> lock(queue_->mu_);
      due = queue_->TakeDueLocked(queue_->fake_now_);
    }
    TimerQueue::RunAll(due);
  }
  return timer;
}

void FakeClock::Advance(Duration d) {
  std::vector<std::shared_ptr<TimerQueue::Entry>> due;
  {
    std::lock_guard<std::mutex> lock(queue_->mu_);
    queue_->fake_now_ += d;
    due = queue_->TakeDueLocked(queue_->fake_now_);
  }
  TimerQueue::RunAll(due);
}

size_t FakeClock::PendingTimers() const {
  std::lock_guard<std::mutex> lock(queue_->mu_);
  return queue_->entries_.size();
}

bool FakeClock::BlockUntilTimers(size_t n, std::chrono::milliseconds real_timeout) const {
  std::unique_lock<std::mutex> lock(queue_->mu_);
  return queue_->changed_.wait_for(lock, real_timeout, [&] { return queue_->entries_.size() >= n; });
}

}  // namespace capsule
