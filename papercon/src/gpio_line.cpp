#include "gpio_line.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>

namespace {

int bias_flags(Bias b){
  switch (b){
    case Bias::PullUp:   return GPIOD_LINE_REQUEST_FLAG_BIAS_PULL_UP;
    case Bias::PullDown: return GPIOD_LINE_REQUEST_FLAG_BIAS_PULL_DOWN;
    case Bias::Disabled: return GPIOD_LINE_REQUEST_FLAG_BIAS_DISABLE;
    case Bias::AsIs:     break;
  }
  return 0;
}

[[noreturn]] void throw_request_failed(const std::string& what){
  int err = errno;
  HwError kind = (err == EBUSY) ? HwError::LineBusy : HwError::IoError;
  throw GpioError(kind, what + ": " + std::strerror(err));
}

}

GpioChip::GpioChip(const std::string& path) : path_(path) {
  chip_ = gpiod_chip_open(path.c_str());
  if (!chip_) throw GpioError(HwError::DeviceUnavailable, "gpiod_chip_open " + path + ": " + std::strerror(errno));
}

GpioChip::~GpioChip() {
  if (chip_) gpiod_chip_close(chip_);
}

GpioLine::GpioLine(const GpioLineCfg& cfg) : chip_(cfg.chip) {
  line_ = gpiod_chip_get_line(chip_.get(), cfg.line);
  if (!line_) throw GpioError(HwError::IoError, "gpiod_chip_get_line " + std::to_string(cfg.line));

  gpiod_line_request_config rc{};
  rc.consumer = cfg.consumer.c_str();
  if (cfg.edge_rising && cfg.edge_falling) rc.request_type = GPIOD_LINE_REQUEST_EVENT_BOTH_EDGES;
  else if (cfg.edge_rising) rc.request_type = GPIOD_LINE_REQUEST_EVENT_RISING_EDGE;
  else rc.request_type = GPIOD_LINE_REQUEST_EVENT_FALLING_EDGE;
  rc.flags = bias_flags(cfg.bias);
  if (cfg.active_low) rc.flags |= GPIOD_LINE_REQUEST_FLAG_ACTIVE_LOW;

  if (gpiod_line_request(line_, &rc, 0) < 0) {
    line_ = nullptr;
    throw_request_failed("event request on line " + std::to_string(cfg.line));
  }
}

GpioLine::~GpioLine() {
  if (line_) gpiod_line_release(line_);
}

bool GpioLine::wait(std::chrono::milliseconds timeout) {
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  ts.tv_nsec = static_cast<long>((timeout.count() % 1000) * 1000000L);
  int r = gpiod_line_event_wait(line_, &ts);
  if (r < 0) {
    if (errno == EINTR) return false;
    throw GpioError(HwError::IoError, std::string("gpiod_line_event_wait: ") + std::strerror(errno));
  }
  return r == 1;
}

std::vector<Edge> GpioLine::read_events(unsigned max_events) {
  std::vector<gpiod_line_event> evs(max_events);
  int n = gpiod_line_event_read_multiple(line_, evs.data(), max_events);
  if (n < 0) throw GpioError(HwError::IoError, std::string("gpiod_line_event_read_multiple: ") + std::strerror(errno));
  std::vector<Edge> out;
  out.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i)
    out.push_back(evs[i].event_type == GPIOD_LINE_EVENT_RISING_EDGE ? Edge::Rising : Edge::Falling);
  return out;
}

GpioLineBank::GpioLineBank(const GpioBankCfg& cfg) : chip_(cfg.chip) {
  if (cfg.lines.empty() || cfg.lines.size() > GPIOD_LINE_BULK_MAX_LINES)
    throw GpioError(HwError::IoError, "line bank needs 1.." + std::to_string(GPIOD_LINE_BULK_MAX_LINES) + " offsets");

  std::vector<unsigned> offsets(cfg.lines);
  gpiod_line_bulk_init(&bulk_);
  if (gpiod_chip_get_lines(chip_.get(), offsets.data(), static_cast<unsigned>(offsets.size()), &bulk_) < 0)
    throw GpioError(HwError::IoError, std::string("gpiod_chip_get_lines: ") + std::strerror(errno));
  count_ = offsets.size();

  gpiod_line_request_config rc{};
  rc.consumer = cfg.consumer.c_str();
  rc.request_type = cfg.output ? GPIOD_LINE_REQUEST_DIRECTION_OUTPUT : GPIOD_LINE_REQUEST_DIRECTION_INPUT;
  rc.flags = bias_flags(cfg.bias);
  if (cfg.active_low) rc.flags |= GPIOD_LINE_REQUEST_FLAG_ACTIVE_LOW;

  std::vector<int> defaults(count_, 0);
  for (size_t i = 0; i < count_ && i < cfg.defaults.size(); ++i) defaults[i] = cfg.defaults[i] ? 1 : 0;

  if (gpiod_line_request_bulk(&bulk_, &rc, cfg.output ? defaults.data() : nullptr) < 0)
    throw_request_failed("bulk request of " + std::to_string(count_) + " lines");
  requested_ = true;
}

GpioLineBank::~GpioLineBank() {
  if (requested_) gpiod_line_release_bulk(&bulk_);
}

std::vector<int> GpioLineBank::get_values() {
  std::vector<int> v(count_, 0);
  if (gpiod_line_get_value_bulk(&bulk_, v.data()) < 0)
    throw GpioError(HwError::IoError, std::string("gpiod_line_get_value_bulk: ") + std::strerror(errno));
  return v;
}

void GpioLineBank::set_values(const std::vector<int>& values) {
  if (values.size() != count_)
    throw GpioError(HwError::IoError, "expected " + std::to_string(count_) + " values, got " + std::to_string(values.size()));
  std::vector<int> v(values);
  if (gpiod_line_set_value_bulk(&bulk_, v.data()) < 0)
    throw GpioError(HwError::IoError, std::string("gpiod_line_set_value_bulk: ") + std::strerror(errno));
}
