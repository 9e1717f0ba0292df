#pragma once
#include <stdexcept>
#include <string>

enum class HwError {
  DeviceUnavailable,  // chip or port missing / cannot be opened
  LineBusy,           // kernel reports the line already reserved
  IoError,            // transient read/write failure
  ProtocolTimeout     // status query got no reply in time
};

const char* to_string(HwError e);

class GpioError : public std::runtime_error {
public:
  GpioError(HwError kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
  HwError kind() const { return kind_; }
private:
  HwError kind_;
};
