#include "init_retry.hpp"
#include "log.hpp"

const char* to_string(InitState s){
  switch (s){
    case InitState::Uninit:   return "uninit";
    case InitState::Retrying: return "retrying";
    case InitState::Ready:    return "ready";
    case InitState::Failed:   return "failed";
  }
  return "?";
}

InitRetry::InitRetry(std::string name, RetryPolicy policy, Attempt attempt)
    : name_(std::move(name)), policy_(policy), attempt_(std::move(attempt)) {}

InitRetry::~InitRetry(){ cancel(); }

InitState InitRetry::step(){
  InitState s = state_.load();
  if (s == InitState::Ready || s == InitState::Failed) return s;

  int n = ++attempts_;
  bool ok = false;
  try {
    ok = attempt_();
  } catch (const std::exception& e){
    log_warn("retry") << name_ << " attempt " << n << " threw: " << e.what();
  }

  if (ok) s = InitState::Ready;
  else if (n > policy_.max_retries) s = InitState::Failed;
  else s = InitState::Retrying;

  {
    std::lock_guard<std::mutex> lk(mu_);
    state_ = s;
  }
  cv_.notify_all();
  return s;
}

InitState InitRetry::start(){
  InitState s = step();
  if (s == InitState::Retrying){
    log_warn("retry") << name_ << " unavailable, retrying up to " << policy_.max_retries
                      << " times every " << policy_.interval.count() << " ms";
    th_ = std::thread([this]{ run(); });
  }
  return s;
}

void InitRetry::run(){
  for (;;){
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_for(lk, policy_.interval, [this]{ return cancelled_; })) return;
    }
    InitState s = step();
    if (s == InitState::Ready){
      log_info("retry") << name_ << " recovered after " << attempts_.load() << " attempts";
      return;
    }
    if (s == InitState::Failed){
      log_error("retry") << name_ << " gave up after " << attempts_.load() << " attempts";
      return;
    }
  }
}

void InitRetry::cancel(){
  {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
}

bool InitRetry::settled() const {
  InitState s = state_.load();
  return s == InitState::Ready || s == InitState::Failed;
}

bool InitRetry::wait_settled(std::chrono::milliseconds timeout){
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [this]{ return settled(); });
}
