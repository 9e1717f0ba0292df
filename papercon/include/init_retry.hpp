#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

struct RetryPolicy {
  int max_retries = 10;
  std::chrono::milliseconds interval = std::chrono::seconds(30);
};

enum class InitState { Uninit, Retrying, Ready, Failed };

const char* to_string(InitState s);

// Uninit -> Retrying(n) -> Ready | Failed.
// The first attempt runs inline from step(); later ones run on a background
// thread, one per interval, until one succeeds or max_retries is spent.
class InitRetry {
public:
  using Attempt = std::function<bool()>;

  InitRetry(std::string name, RetryPolicy policy, Attempt attempt);
  ~InitRetry();

  InitRetry(const InitRetry&) = delete;
  InitRetry& operator=(const InitRetry&) = delete;

  // one attempt; returns the resulting state
  InitState step();
  // runs step() inline and, if that fails, continues in the background
  InitState start();
  // stops background retries; waits for the thread
  void cancel();

  InitState state() const { return state_.load(); }
  int attempts() const { return attempts_.load(); }
  // Ready or Failed
  bool settled() const;
  // blocks until settled or the timeout expires
  bool wait_settled(std::chrono::milliseconds timeout);

private:
  void run();

  std::string name_;
  RetryPolicy policy_;
  Attempt attempt_;
  std::atomic<InitState> state_{InitState::Uninit};
  std::atomic<int> attempts_{0};

  std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::thread th_;
};
