#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

// Single-threaded task loop. Any thread may post; tasks run in post order on
// the thread that calls run() or run_pending(). Delayed tasks run once their
// deadline has passed.
class EventLoop {
public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  void post(Task t);
  void post_after(std::chrono::milliseconds delay, Task t);

  // runs until stop() is called or should_stop() returns true
  void run(const std::function<bool()>& should_stop = {});
  void stop();

  // runs every task that is due now; returns how many ran
  int run_pending();
  // runs tasks as they fall due until the queue is empty or timeout expires
  int run_for(std::chrono::milliseconds timeout);

  std::size_t pending() const;

private:
  struct Timed {
    Clock::time_point due;
    uint64_t seq;
    Task task;
    bool operator>(const Timed& o) const { return due != o.due ? due > o.due : seq > o.seq; }
  };

  bool pop_due(Task& out);
  void run_task(Task& t);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::priority_queue<Timed, std::vector<Timed>, std::greater<Timed>> q_;
  uint64_t seq_ = 0;
  bool stop_ = false;
};
