#include "console.hpp"
#include "log.hpp"

#include <cstdlib>

namespace {
struct QuickAction {
  int position;
  const char* label;
};

const QuickAction kQuickActions[] = {
  {1, "Print status"},
  {2, "Print sample page"},
  {3, "Print channel again"},
  {4, "Clear printer buffer"},
  {8, "Cancel"},
};
}

Console::Console(EventLoop& loop, Printer& printer, DialDriver& dial, ConsoleConfig cfg)
    : loop_(loop), printer_(printer), dial_(dial), cfg_(cfg), gate_(cfg.print_debounce) {}

Console::~Console(){
  wait_idle();
}

void Console::set_channel(int position, std::vector<ModulePtr> modules){
  std::lock_guard<std::mutex> lk(channels_mu_);
  channels_[position] = std::move(modules);
}

bool Console::has_channel(int position) const {
  std::lock_guard<std::mutex> lk(channels_mu_);
  return channels_.count(position) != 0;
}

void Console::set_status_lines(StatusModule::LinesFn fn){
  status_lines_ = std::move(fn);
}

void Console::attach(ButtonDriver& button){
  button.set_tap_callback([this]{ loop_.post([this]{ on_tap(); }); });
  button.set_long_press_callback([this]{ loop_.post([this]{ on_long_press(); }); });
  button.set_long_press_ready_callback([this]{ loop_.post([this]{ on_long_press_ready(); }); });
  button.set_factory_reset_callback([this]{ loop_.post([this]{ on_factory_reset(); }); });
}

void Console::attach(DialDriver& dial){
  dial.register_position_listener([this](int pos){ loop_.post([this, pos]{ on_dial(pos); }); });
}

void Console::on_dial(int position){
  if (selection_.active()){
    log_debug("console") << "menu choice " << position;
    return;
  }
  std::string names;
  {
    std::lock_guard<std::mutex> lk(channels_mu_);
    auto it = channels_.find(position);
    if (it != channels_.end())
      for (const auto& m : it->second) names += (names.empty() ? "" : " + ") + m->name();
  }
  log_info("console") << "channel " << position << ": " << (names.empty() ? "(empty)" : names);
}

void Console::run_worker(const std::string& name, std::function<void()> fn){
  reap_workers();
  auto fut = std::async(std::launch::async, [name, fn = std::move(fn)]{
    try {
      fn();
    } catch (const std::exception& e){
      log_error("console") << name << " failed: " << e.what();
    }
  });
  std::lock_guard<std::mutex> lk(workers_mu_);
  workers_.push_back(std::move(fut));
}

void Console::reap_workers(){
  std::lock_guard<std::mutex> lk(workers_mu_);
  auto done = [](std::future<void>& f){
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  };
  for (auto it = workers_.begin(); it != workers_.end();){
    if (done(*it)){
      it->get();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void Console::wait_idle(){
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    pending.swap(workers_);
  }
  for (auto& f : pending) f.get();
}

bool Console::start_job(const std::string& name, std::function<void(Printer&)> body){
  if (!gate_.try_begin()){
    log_info("console") << "ignoring " << name << ", a print started moments ago";
    return false;
  }
  ++jobs_started_;
  log_info("console") << "printing " << name;
  run_worker(name, [this, body = std::move(body)]{
    struct Finish {
      PrintGate& g;
      ~Finish(){ g.finish(); }
    } finish{gate_};
    body(printer_);
  });
  return true;
}

void Console::print_channel(Printer& p, int position){
  std::vector<ModulePtr> modules;
  {
    std::lock_guard<std::mutex> lk(channels_mu_);
    auto it = channels_.find(position);
    if (it != channels_.end()) modules = it->second;
  }
  if (modules.empty()){
    auto empty = std::make_shared<TextModule>(
        "Channel " + std::to_string(position),
        std::vector<std::string>{"Nothing is assigned to this position."});
    modules.push_back(empty);
  }
  int ok = print_job(p, modules, cfg_.max_lines);
  if (ok < static_cast<int>(modules.size()))
    log_warn("console") << "channel " << position << ": " << modules.size() - ok << " module(s) failed";
}

void Console::on_tap(){
  int position = dial_.read_position();
  if (selection_.active()){
    start_job("selection " + std::to_string(position), [this, position](Printer&){
      selection_.dispatch(position);
    });
    return;
  }
  start_job("channel " + std::to_string(position), [this, position](Printer& p){
    print_channel(p, position);
  });
}

void Console::print_quick_actions(Printer& p){
  p.reset_buffer();
  p.print_header("Quick actions");
  for (const auto& a : kQuickActions)
    p.print_body(std::to_string(a.position) + "  " + a.label);
  p.print_caption("Turn the dial to a number and tap.");
  p.flush_buffer();
  p.feed_direct(p.cutter_feed());
}

void Console::on_long_press(){
  std::string owner = "quick-actions-" + std::to_string(++menu_seq_);
  menu_channel_ = dial_.read_position();
  bool started = start_job("quick actions", [this](Printer& p){ print_quick_actions(p); });
  if (!started) return;

  selection_.enter([this](int pos){ on_quick_action(pos); }, owner);
  loop_.post_after(cfg_.quick_actions_timeout, [this, owner]{
    selection_.exit_if_owner(owner);
  });
}

// runs on the worker that holds the print gate
void Console::on_quick_action(int position){
  selection_.exit();
  switch (position){
    case 1:
      print_job(printer_, {std::make_shared<StatusModule>(status_lines_)}, cfg_.max_lines);
      break;
    case 2:
      print_job(printer_, {std::make_shared<SampleModule>()}, cfg_.max_lines);
      break;
    case 3:
      print_channel(printer_, menu_channel_.load());
      break;
    case 4:
      printer_.clear_hardware_buffer();
      break;
    default:
      log_info("console") << "quick actions closed";
      break;
  }
}

void Console::on_long_press_ready(){
  run_worker("blip", [this]{ printer_.blip(); });
}

void Console::on_factory_reset(){
  ++factory_resets_;
  selection_.exit();
  log_warn("console") << "factory reset requested";
  std::string cmd = cfg_.factory_reset_cmd;
  run_worker("factory reset", [this, cmd]{
    // never rejected; waits for a job that is still using the buffer
    gate_.begin_wait();
    struct Finish {
      PrintGate& g;
      ~Finish(){ g.finish(); }
    } finish{gate_};
    printer_.reset_buffer();
    printer_.print_header("Factory reset");
    printer_.print_body("Restoring defaults. The device will restart.");
    printer_.flush_buffer();
    printer_.feed_direct(printer_.cutter_feed());
    if (cmd.empty()) return;
    int rc = std::system(cmd.c_str());
    if (rc != 0) log_error("console") << "factory reset command exited with " << rc;
  });
}
