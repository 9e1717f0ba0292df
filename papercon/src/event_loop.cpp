#include "event_loop.hpp"
#include "log.hpp"

#include <algorithm>

void EventLoop::post(Task t){
  post_after(std::chrono::milliseconds(0), std::move(t));
}

void EventLoop::post_after(std::chrono::milliseconds delay, Task t){
  {
    std::lock_guard<std::mutex> lk(mu_);
    q_.push(Timed{Clock::now() + delay, seq_++, std::move(t)});
  }
  cv_.notify_one();
}

void EventLoop::stop(){
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
}

std::size_t EventLoop::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

bool EventLoop::pop_due(Task& out){
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.empty() || q_.top().due > Clock::now()) return false;
  out = q_.top().task;
  q_.pop();
  return true;
}

void EventLoop::run_task(Task& t){
  try {
    t();
  } catch (const std::exception& e){
    log_error("loop") << "task failed: " << e.what();
  }
}

int EventLoop::run_pending(){
  int n = 0;
  Task t;
  while (pop_due(t)){
    run_task(t);
    ++n;
  }
  return n;
}

int EventLoop::run_for(std::chrono::milliseconds timeout){
  auto deadline = Clock::now() + timeout;
  int n = 0;
  while (Clock::now() < deadline){
    n += run_pending();
    std::unique_lock<std::mutex> lk(mu_);
    if (q_.empty()) break;
    cv_.wait_until(lk, std::min(deadline, q_.top().due));
  }
  return n;
}

void EventLoop::run(const std::function<bool()>& should_stop){
  for (;;){
    run_pending();
    std::unique_lock<std::mutex> lk(mu_);
    if (stop_) break;
    if (should_stop && should_stop()) break;
    // wake at least every 100 ms to observe should_stop
    auto wake = Clock::now() + std::chrono::milliseconds(100);
    if (!q_.empty() && q_.top().due < wake) wake = q_.top().due;
    cv_.wait_until(lk, wake, [&]{
      return stop_ || (!q_.empty() && q_.top().due <= Clock::now());
    });
  }
}
