#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "button_driver.hpp"
#include "content.hpp"
#include "dial_driver.hpp"
#include "event_loop.hpp"
#include "print_gate.hpp"
#include "printer.hpp"
#include "selection_mode.hpp"

struct ConsoleConfig {
  int max_lines = 0;
  std::chrono::milliseconds print_debounce = std::chrono::seconds(2);
  std::chrono::milliseconds quick_actions_timeout = std::chrono::seconds(60);
  std::string factory_reset_cmd;
};

// Ties the dial, the button and the printer together. Hardware callbacks
// post to the event loop; every print job runs on a worker thread behind the
// print gate so the loop never waits on the serial port.
class Console {
public:
  Console(EventLoop& loop, Printer& printer, DialDriver& dial, ConsoleConfig cfg = ConsoleConfig());
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  void set_channel(int position, std::vector<ModulePtr> modules);
  bool has_channel(int position) const;
  // extra lines for the status receipt printed from quick actions
  void set_status_lines(StatusModule::LinesFn fn);

  // registers the four button callbacks; they only post to the loop
  void attach(ButtonDriver& button);
  // follows dial changes for logging
  void attach(DialDriver& dial);

  // loop-thread handlers
  void on_tap();
  void on_long_press();
  void on_long_press_ready();
  void on_factory_reset();
  void on_dial(int position);

  // Starts a job unless one is running or one started inside the debounce
  // window. Returns false when rejected.
  bool start_job(const std::string& name, std::function<void(Printer&)> body);

  // waits for every worker started so far
  void wait_idle();

  SelectionMode& selection() { return selection_; }
  PrintGate& gate() { return gate_; }
  int jobs_started() const { return jobs_started_.load(); }
  int factory_resets() const { return factory_resets_.load(); }

private:
  void run_worker(const std::string& name, std::function<void()> fn);
  void reap_workers();

  void print_channel(Printer& p, int position);
  void print_quick_actions(Printer& p);
  void on_quick_action(int position);

  EventLoop& loop_;
  Printer& printer_;
  DialDriver& dial_;
  ConsoleConfig cfg_;

  PrintGate gate_;
  SelectionMode selection_;

  mutable std::mutex channels_mu_;
  std::map<int, std::vector<ModulePtr>> channels_;

  std::mutex workers_mu_;
  std::vector<std::future<void>> workers_;

  StatusModule::LinesFn status_lines_;

  std::atomic<int> menu_seq_{0};
  std::atomic<int> menu_channel_{1};
  std::atomic<int> jobs_started_{0};
  std::atomic<int> factory_resets_{0};
};
