#include "dial_driver.hpp"
#include "log.hpp"

int position_from_levels(const std::vector<int>& levels, int last){
  for (size_t i = 0; i < levels.size() && i < static_cast<size_t>(kDialPositions); ++i)
    if (levels[i] == 0) return static_cast<int>(i) + 1;
  return last;
}

DialDriver::DialDriver(DialConfig cfg) : cfg_(std::move(cfg)) {}

DialDriver::~DialDriver(){ stop(); }

void DialDriver::register_position_listener(Listener cb){
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(std::move(cb));
}

void DialDriver::start(){
  if (retry_) return;
  if (cfg_.lines.size() != static_cast<size_t>(kDialPositions)){
    log_error("dial") << "need exactly " << kDialPositions << " lines, got " << cfg_.lines.size();
    return;
  }
  retry_ = std::make_unique<InitRetry>("dial", cfg_.retry, [this]{ return try_init(); });
  retry_->start();
}

bool DialDriver::try_init(){
  try {
    if (cfg_.common_line){
      GpioBankCfg cc{cfg_.chip, {*cfg_.common_line}, true, Bias::AsIs, false, {0}, cfg_.consumer};
      common_ = std::make_unique<GpioLineBank>(cc);
      common_->set_values({0});
    }
    GpioBankCfg ic{cfg_.chip, cfg_.lines, false, Bias::PullUp, false, {}, cfg_.consumer};
    inputs_ = std::make_unique<GpioLineBank>(ic);
    position_ = position_from_levels(inputs_->get_values(), position_.load());
  } catch (const GpioError& e){
    log_warn("dial") << "init failed (" << to_string(e.kind()) << "): " << e.what();
    inputs_.reset();
    common_.reset();
    return false;
  }
  log_info("dial") << "initialized at position " << position_.load();
  running_ = true;
  poller_ = std::thread([this]{ poll_loop(); });
  return true;
}

void DialDriver::stop(){
  if (retry_) retry_->cancel();
  running_ = false;
  if (poller_.joinable()) poller_.join();
  inputs_.reset();
  common_.reset();
}

void DialDriver::poll_loop(){
  while (running_){
    try {
      update(inputs_->get_values());
      std::this_thread::sleep_for(cfg_.poll);
    } catch (const std::exception& e){
      log_warn("dial") << "poll error: " << e.what();
      if (running_) std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
}

bool DialDriver::update(const std::vector<int>& levels){
  int last = position_.load();
  int pos = position_from_levels(levels, last);
  if (pos == last) return false;
  position_ = pos;
  log_debug("dial") << "position changed to " << pos;
  notify(pos);
  return true;
}

bool DialDriver::set_position(int position){
  if (position < 1 || position > kDialPositions){
    log_warn("dial") << "invalid position " << position;
    return false;
  }
  if (position_.exchange(position) == position) return false;
  log_info("dial") << "position set to " << position << " (software override)";
  notify(position);
  return true;
}

void DialDriver::notify(int position){
  std::vector<Listener> ls;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    ls = listeners_;
  }
  for (auto& cb : ls){
    try {
      cb(position);
    } catch (const std::exception& e){
      log_warn("dial") << "listener failed: " << e.what();
    }
  }
}
