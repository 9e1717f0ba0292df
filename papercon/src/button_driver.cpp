#include "button_driver.hpp"
#include "log.hpp"

namespace {
std::chrono::nanoseconds monotonic_now(){
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now().time_since_epoch());
}
}

ButtonDriver::ButtonDriver(ButtonConfig cfg) : cfg_(std::move(cfg)), tracker_(cfg_.thresholds) {}

ButtonDriver::~ButtonDriver(){ stop(); }

void ButtonDriver::set_tap_callback(Callback cb){ std::lock_guard<std::mutex> lk(cb_mu_); on_tap_ = std::move(cb); }
void ButtonDriver::set_long_press_callback(Callback cb){ std::lock_guard<std::mutex> lk(cb_mu_); on_long_press_ = std::move(cb); }
void ButtonDriver::set_factory_reset_callback(Callback cb){ std::lock_guard<std::mutex> lk(cb_mu_); on_factory_reset_ = std::move(cb); }
void ButtonDriver::set_long_press_ready_callback(Callback cb){ std::lock_guard<std::mutex> lk(cb_mu_); on_ready_ = std::move(cb); }

void ButtonDriver::start(){
  if (retry_) return;
  retry_ = std::make_unique<InitRetry>("button", cfg_.retry, [this]{ return try_init(); });
  retry_->start();
}

bool ButtonDriver::try_init(){
  try {
    GpioLineCfg lc{cfg_.chip, cfg_.line, true, true, Bias::PullUp, false, cfg_.consumer};
    line_ = std::make_unique<GpioLine>(lc);
  } catch (const GpioError& e){
    log_warn("button") << "init failed (" << to_string(e.kind()) << "): " << e.what();
    line_.reset();
    return false;
  }
  running_ = true;
  monitor_ = std::thread([this]{ monitor_loop(); });
  log_info("button") << "monitoring " << cfg_.chip << " line " << cfg_.line;
  return true;
}

void ButtonDriver::stop(){
  if (retry_) retry_->cancel();
  running_ = false;
  if (monitor_.joinable()) monitor_.join();
  line_.reset();
}

void ButtonDriver::monitor_loop(){
  while (running_){
    try {
      if (line_->wait(cfg_.hold_check)){
        // bounded batch, oldest first
        for (Edge e : line_->read_events(16)) handle(EdgeStamp{e, monotonic_now()});
      }
      tick(monotonic_now());
    } catch (const std::exception& e){
      log_warn("button") << "monitor error: " << e.what();
      if (running_) std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
}

void ButtonDriver::handle(const EdgeStamp& es){
  std::vector<PressAction> actions;
  {
    std::lock_guard<std::mutex> lk(tracker_mu_);
    actions = tracker_.on_edge(es);
  }
  for (PressAction a : actions) fire(a);
}

void ButtonDriver::tick(std::chrono::nanoseconds now){
  std::vector<PressAction> actions;
  {
    std::lock_guard<std::mutex> lk(tracker_mu_);
    actions = tracker_.on_tick(now);
  }
  for (PressAction a : actions) fire(a);
}

void ButtonDriver::fire(PressAction a){
  Callback cb;
  {
    std::lock_guard<std::mutex> lk(cb_mu_);
    switch (a){
      case PressAction::Tap:            cb = on_tap_; break;
      case PressAction::LongPressReady: cb = on_ready_; break;
      case PressAction::LongPress:      cb = on_long_press_; break;
      case PressAction::FactoryReset:   cb = on_factory_reset_; break;
    }
  }
  log_debug("button") << to_string(a);
  if (!cb) return;
  try {
    cb();
  } catch (const std::exception& e){
    log_error("button") << to_string(a) << " callback failed: " << e.what();
  }
}
