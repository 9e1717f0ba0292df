#include "hw_error.hpp"

const char* to_string(HwError e){
  switch (e){
    case HwError::DeviceUnavailable: return "device unavailable";
    case HwError::LineBusy:          return "line busy";
    case HwError::IoError:           return "i/o error";
    case HwError::ProtocolTimeout:   return "protocol timeout";
  }
  return "unknown";
}
