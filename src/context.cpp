#include "context.hpp"

#include "clock.hpp"

#include <algorithm>
#include <utility>

namespace capsule {

void Waker::Notify() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    notified_ = true;
  }
  cv_.notify_all();
}

void Waker::Wait() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return notified_; });
  notified_ = false;
}

void Signal::Fire() {
  std::vector<std::shared_ptr<Waker>> wakers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (fired_) return;
    fired_ = true;
    wakers.swap(wakers_);
  }
  for (const auto& w : wakers) w->Notify();
}

bool Signal::Fired() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fired_;
}

void Signal::Subscribe(const std::shared_ptr<Waker>& waker) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!fired_) {
      wakers_.push_back(waker);
      return;
    }
  }
  waker->Notify();
}

void Signal::Unsubscribe(const Waker* waker) {
  std::lock_guard<std::mutex> lock(mu_);
  wakers_.erase(std::remove_if(wakers_.begin(), wakers_.end(),
                               [waker](const std::shared_ptr<Waker>& w) { return w.get() == waker; }),
                wakers_.end());
}

size_t WaitAny(const std::vector<Signal*>& signals) {
  auto waker = std::make_shared<Waker>();
  for (auto* s : signals) s->Subscribe(waker);

  size_t hit = signals.size();
  while (hit == signals.size()) {
    for (size_t i = 0; i < signals.size(); i++) {
      if (signals[i]->Fired()) {
        hit = i;
        break;
      }
    }
    if (hit == signals.size()) waker->Wait();
  }

  for (auto* s : signals) s->Unsubscribe(waker.get());
  return hit;
}

struct Context::State {
  Signal done;
  std::mutex mu;
  ContextErr err = ContextErr::kNone;
  std::shared_ptr<Timer> timer;

  ~State() {
    if (timer) timer->Stop();
  }

  void Finish(ContextErr why) {
    std::shared_ptr<Timer> t;
    {
      std::lock_guard<std::mutex> lock(mu);
      if (err != ContextErr::kNone) return;
      err = why;
      t = std::move(timer);
    }
    if (t && why != ContextErr::kDeadlineExceeded) t->Stop();
    done.Fire();
  }
};

Context::Context() : state_(std::make_shared<State>()) {}

Context Context::Background() {
  return Context();
}

Context Context::WithCancel() {
  return Context();
}

Context Context::WithTimeout(const std::shared_ptr<Clock>& clock, std::chrono::milliseconds timeout) {
  Context ctx;
  std::weak_ptr<State> weak = ctx.state_;
  auto timer = clock->AfterFunc(timeout, [weak]() {
    if (auto st = weak.lock()) st->Finish(ContextErr::kDeadlineExceeded);
  });
  std::lock_guard<std::mutex> lock(ctx.state_->mu);
  if (ctx.state_->err == ContextErr::kNone) ctx.state_->timer = std::move(timer);
  return ctx;
}

void Context::Cancel() const {
  state_->Finish(ContextErr::kCanceled);
}

bool Context::IsDone() const {
  return state_->done.Fired();
}

ContextErr Context::Err() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->err;
}

std::string Context::ErrString() const {
  switch (Err()) {
    case ContextErr::kCanceled:
      return "context canceled";
    case ContextErr::kDeadlineExceeded:
      return "context deadline exceeded";
    case ContextErr::kNone:
      break;
  }
  return {};
}

Signal* Context::Done() const {
  return &state_->done;
}

}  // namespace capsule
