#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>

// Process-wide overlay that redirects the next taps to a menu handler.
// One owner at a time; enter() always supersedes the current owner.
class SelectionMode {
public:
  using Callback = std::function<void(int)>;

  void enter(Callback cb, std::string owner_id);
  void exit();
  // exits only if owner_id still holds the session; for timeouts that may
  // fire after a newer session took over
  bool exit_if_owner(const std::string& owner_id);

  // false (and no effect) with no session; otherwise runs callback(position).
  // A throwing callback is logged and the session is cleared.
  bool dispatch(int position);

  bool active() const;
  std::optional<std::string> owner() const;

private:
  mutable std::mutex mu_;
  Callback cb_;
  std::optional<std::string> owner_;
};
