#include "escpos.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstddef>
#include <thread>

namespace {
const std::vector<uint8_t> kWake = {0x00, 0x00, 0x00, 0x00, 0x00};
const std::vector<uint8_t> kReset = {0x1B, 0x40};            // ESC @
const std::vector<uint8_t> kCancelKanji = {0x1C, 0x2E};      // FS .
const std::vector<uint8_t> kCharsetUsa = {0x1B, 0x52, 0x00}; // ESC R 0
const std::vector<uint8_t> kCodePage437 = {0x1B, 0x74, 0x00};// ESC t 0
const std::vector<uint8_t> kCancel = {0x18};                 // CAN
const std::vector<uint8_t> kBlip = {0x1B, 0x4A, 0x02};       // ESC J 2
const std::vector<uint8_t> kQueryStatus = {0x10, 0x04, 0x01};// DLE EOT 1
const std::vector<uint8_t> kQueryPaper = {0x1D, 0x72, 0x01}; // GS r 1

std::vector<uint8_t> raster_command(const std::vector<uint8_t>& packed, int xb, int first_row, int rows){
  std::vector<uint8_t> out = {
    0x1D, 0x76, 0x30, 0x00,
    static_cast<uint8_t>(xb & 0xFF), static_cast<uint8_t>((xb >> 8) & 0xFF),
    static_cast<uint8_t>(rows & 0xFF), static_cast<uint8_t>((rows >> 8) & 0xFF)
  };
  auto begin = packed.begin() + static_cast<std::ptrdiff_t>(first_row) * xb;
  out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(rows) * xb);
  return out;
}
}

namespace escpos {

std::vector<uint8_t> raster(const Bitmap& img){
  return raster_command(img.pack_rows(), img.bytes_per_row(), 0, img.height());
}

std::vector<std::vector<uint8_t>> raster_bands(const Bitmap& img, int max_rows){
  std::vector<std::vector<uint8_t>> out;
  if (img.empty() || max_rows <= 0) return out;
  std::vector<uint8_t> packed = img.pack_rows();
  int xb = img.bytes_per_row();
  for (int y = 0; y < img.height(); y += max_rows)
    out.push_back(raster_command(packed, xb, y, std::min(max_rows, img.height() - y)));
  return out;
}

std::vector<uint8_t> feed_lines(int lines){
  std::vector<uint8_t> out;
  if (lines <= 0) return out;
  out.push_back(0x1B); out.push_back(0x64);
  out.push_back(static_cast<uint8_t>(std::min(lines, 255)));
  int dots = lines * kDotsPerLine;
  while (dots > 0){
    int chunk = std::min(dots, 255);
    out.push_back(0x1B); out.push_back(0x4A);
    out.push_back(static_cast<uint8_t>(chunk));
    dots -= chunk;
  }
  return out;
}

// bit 3: offline
bool busy_from_status(uint8_t b){ return (b & 0x08) != 0; }

PaperStatus paper_from_status(uint8_t b, PaperSensor sensor){
  PaperStatus s;
  if (sensor == PaperSensor::NearEndOnly){
    // this firmware answers 0x0C while paper is running low
    s.near_end = ((b >> 2) & 0x03) == 0x03;
  } else {
    s.out = (b & 0x0C) != 0;
    s.near_end = !s.out && (b & 0x03) != 0;
  }
  s.adequate = !s.out && !s.near_end;
  return s;
}

} // namespace escpos

EscPos::EscPos(Transport& t, EscPosTiming timing, PaperSensor sensor)
    : t_(t), timing_(timing), sensor_(sensor) {}

bool EscPos::send(const std::vector<uint8_t>& bytes){
  if (!t_.is_open()) return false;
  if (!t_.write(bytes)){
    log_warn("escpos") << "write of " << bytes.size() << " bytes failed";
    return false;
  }
  return true;
}

void EscPos::pause(std::chrono::milliseconds d){
  if (d.count() > 0) std::this_thread::sleep_for(d);
}

void EscPos::ascii_settings_locked(){
  send(kCancelKanji);
  send(kCharsetUsa);
  send(kCodePage437);
}

void EscPos::initialize(){
  std::lock_guard<std::mutex> lk(mu_);
  if (!t_.is_open()) return;
  send(kWake);
  pause(timing_.wake);
  send(kReset);
  pause(timing_.reset);
  ascii_settings_locked();
}

void EscPos::ascii_mode(){
  std::lock_guard<std::mutex> lk(mu_);
  send(kCancelKanji);
}

void EscPos::ascii_settings(){
  std::lock_guard<std::mutex> lk(mu_);
  ascii_settings_locked();
}

bool EscPos::print_raster(const Bitmap& img){
  if (img.empty()) return true;
  if (img.bytes_per_row() > 0xFFFF){
    log_error("escpos") << "raster width " << img.width() << " exceeds command limits";
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (!t_.is_open()) return false;
  auto bands = escpos::raster_bands(img);
  if (bands.size() > 1) log_debug("escpos") << "sending " << img.height() << " rows in " << bands.size() << " bands";
  for (const auto& cmd : bands)
    if (!send(cmd)) return false;
  t_.drain();
  return true;
}

void EscPos::feed(int lines){
  if (lines <= 0) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (!t_.is_open()) return;
  pause(timing_.before_feed);
  if (send(escpos::feed_lines(lines))) t_.drain();
}

void EscPos::blip(){
  std::lock_guard<std::mutex> lk(mu_);
  send(kBlip);
}

bool EscPos::is_busy(){
  std::lock_guard<std::mutex> lk(mu_);
  t_.discard_input();
  if (!send(kQueryStatus)) return false;
  auto b = t_.read_byte(timing_.status_timeout);
  if (!b){
    log_debug("escpos") << "no reply to status query, assuming ready";
    return false;
  }
  return escpos::busy_from_status(*b);
}

PaperStatus EscPos::paper_status(){
  std::lock_guard<std::mutex> lk(mu_);
  PaperStatus s;
  if (!t_.is_open()){
    s.error = HwError::DeviceUnavailable;
    return s;
  }
  t_.discard_input();
  std::optional<uint8_t> b;
  if (send(kQueryPaper)) b = t_.read_byte(timing_.status_timeout);
  if (!b){
    s.error = HwError::ProtocolTimeout;
    log_debug("escpos") << "paper query: " << to_string(*s.error);
    return s;
  }
  return escpos::paper_from_status(*b, sensor_);
}

void EscPos::clear_buffer(){
  std::lock_guard<std::mutex> lk(mu_);
  if (!t_.is_open()) return;
  send(kCancel);
  pause(timing_.cancel);
  send(kReset);
  pause(timing_.reset);
  ascii_settings_locked();
}
