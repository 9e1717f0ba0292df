#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "bitmap.hpp"
#include "hw_error.hpp"
#include "transport.hpp"

// Settle times the firmware needs between commands. Tests use none().
struct EscPosTiming {
  std::chrono::milliseconds wake = std::chrono::milliseconds(100);
  std::chrono::milliseconds reset = std::chrono::milliseconds(300);
  std::chrono::milliseconds cancel = std::chrono::milliseconds(50);
  std::chrono::milliseconds before_feed = std::chrono::milliseconds(50);
  std::chrono::milliseconds status_timeout = std::chrono::milliseconds(500);

  static EscPosTiming none(){
    using std::chrono::milliseconds;
    return {milliseconds(0), milliseconds(0), milliseconds(0), milliseconds(0), milliseconds(0)};
  }
};

struct PaperStatus {
  bool adequate = true;
  bool near_end = false;
  bool out = false;
  // set when the query failed; the other fields keep the permissive default
  std::optional<HwError> error;
};

// How the GS r 1 reply encodes the paper sensor.
enum class PaperSensor {
  NearEndOnly,    // bits 2-3 both set = near end; "out" is never reported
  NearEndAndOut   // bits 0-1 = near end, bits 2-3 = out
};

constexpr int kDotsPerLine = 24;
// GS v 0 carries the height in two bytes
constexpr int kMaxRasterRows = 0xFFFF;

namespace escpos {
// GS v 0, normal density, width in bytes and height in rows, 1 = black.
// The image must fit one command (height <= kMaxRasterRows).
std::vector<uint8_t> raster(const Bitmap& img);
// img split top to bottom into bands of at most max_rows, one command each
std::vector<std::vector<uint8_t>> raster_bands(const Bitmap& img, int max_rows = kMaxRasterRows);
// ESC d n followed by ESC J in chunks of at most 255 dots
std::vector<uint8_t> feed_lines(int lines);

bool busy_from_status(uint8_t b);
PaperStatus paper_from_status(uint8_t b, PaperSensor sensor = PaperSensor::NearEndOnly);
}

// Command layer over a Transport. All methods are safe to call from any
// thread; a status query holds the port across its write and read.
class EscPos {
public:
  explicit EscPos(Transport& t, EscPosTiming timing = EscPosTiming(),
                  PaperSensor sensor = PaperSensor::NearEndOnly);

  // wake bytes, ESC @, ASCII settings
  void initialize();
  // FS . only; cancels the double-byte mode some firmwares default to
  void ascii_mode();
  // FS ., ESC R 0, ESC t 0
  void ascii_settings();

  // one GS v 0 per band of kMaxRasterRows, drained once at the end
  bool print_raster(const Bitmap& img);
  void feed(int lines);
  void blip();

  // DLE EOT 1; false (ready) when the printer does not answer
  bool is_busy();
  // GS r 1; error is DeviceUnavailable on a closed port, ProtocolTimeout
  // when the printer does not answer
  PaperStatus paper_status();
  // CAN, ESC @, ASCII settings
  void clear_buffer();

  bool connected() const { return t_.is_open(); }

private:
  bool send(const std::vector<uint8_t>& bytes);
  void pause(std::chrono::milliseconds d);
  void ascii_settings_locked();

  Transport& t_;
  EscPosTiming timing_;
  PaperSensor sensor_;
  std::mutex mu_;
};
