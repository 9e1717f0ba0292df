#include "print_gate.hpp"

bool PrintGate::try_begin(Clock::time_point now){
  std::lock_guard<std::mutex> lk(mu_);
  if (in_progress_) return false;
  if (last_start_ && now - *last_start_ < debounce_) return false;
  in_progress_ = true;
  last_start_ = now;
  return true;
}

void PrintGate::begin_wait(){
  std::unique_lock<std::mutex> lk(mu_);
  idle_.wait(lk, [this]{ return !in_progress_; });
  in_progress_ = true;
  last_start_ = Clock::now();
}

void PrintGate::finish(){
  {
    std::lock_guard<std::mutex> lk(mu_);
    in_progress_ = false;
  }
  idle_.notify_all();
}

bool PrintGate::busy() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_progress_;
}
