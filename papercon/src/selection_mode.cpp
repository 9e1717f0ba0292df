#include "selection_mode.hpp"
#include "log.hpp"

void SelectionMode::enter(Callback cb, std::string owner_id){
  std::lock_guard<std::mutex> lk(mu_);
  if (owner_) log_info("selection") << owner_id << " supersedes " << *owner_;
  else log_info("selection") << "entered for " << owner_id;
  cb_ = std::move(cb);
  owner_ = std::move(owner_id);
}

void SelectionMode::exit(){
  std::lock_guard<std::mutex> lk(mu_);
  if (owner_) log_info("selection") << "exited (" << *owner_ << ")";
  cb_ = nullptr;
  owner_.reset();
}

bool SelectionMode::exit_if_owner(const std::string& owner_id){
  std::lock_guard<std::mutex> lk(mu_);
  if (!owner_ || *owner_ != owner_id) return false;
  log_info("selection") << "expired (" << owner_id << ")";
  cb_ = nullptr;
  owner_.reset();
  return true;
}

bool SelectionMode::dispatch(int position){
  Callback cb;
  std::string owner;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!owner_ || !cb_) return false;
    cb = cb_;
    owner = *owner_;
  }
  // called unlocked: the handler may enter() or exit() itself
  try {
    cb(position);
  } catch (const std::exception& e){
    log_error("selection") << owner << " callback failed at position " << position << ": " << e.what();
    std::lock_guard<std::mutex> lk(mu_);
    // a session entered by the failing handler is cleared too
    cb_ = nullptr;
    owner_.reset();
  }
  return true;
}

bool SelectionMode::active() const {
  std::lock_guard<std::mutex> lk(mu_);
  return owner_.has_value();
}

std::optional<std::string> SelectionMode::owner() const {
  std::lock_guard<std::mutex> lk(mu_);
  return owner_;
}
