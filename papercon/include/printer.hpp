#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "escpos.hpp"
#include "print_ops.hpp"
#include "renderer.hpp"
#include "transport.hpp"

struct PrinterConfig {
  int width = kPrinterWidth;
  std::size_t max_ops = 1000;   // buffer ceiling; reaching it forces a flush
  int cutter_feed = 3;          // lines fed after each job
  PaperSensor paper_sensor = PaperSensor::NearEndOnly;
};

// Buffered receipt printer. Content calls append print operations; a flush
// renders the whole buffer into one canvas, turns it 180 degrees (the paper
// leaves the head tear-off edge first) and sends it as a single raster
// command.
class Printer {
public:
  using PreviewSink = std::function<void(const Bitmap&)>;

  Printer(Transport& t, PrinterConfig cfg = PrinterConfig(), EscPosTiming timing = EscPosTiming());

  void initialize();

  void print_header(const std::string& text);
  void print_subheader(const std::string& text);
  void print_body(const std::string& text);
  void print_caption(const std::string& text);
  void print_bold(const std::string& text);
  void print_line();
  void print_text(const std::string& text, TextStyle style = TextStyle::Regular);
  void print_qr(const std::string& data, int size = 4, char error_correction = 'M', bool fixed_size = false);
  void print_moon_phase(double phase, int size = 60);
  void print_maze(const Grid& grid, int cell_size = 8);
  void print_sudoku(const Grid& grid, int cell_size = 16);
  void feed(int lines = 3);

  // starts a job: clears the buffer and sets the text line budget (0 = none)
  void reset_buffer(int max_lines = 0);
  void flush_buffer();

  // true once the job's text lines reach max_lines; lets content stop early
  bool is_max_lines_exceeded() const;
  bool was_truncated() const;
  std::size_t buffered_ops() const;

  // unbuffered paper movement
  void feed_direct(int lines = 3);
  void blip();
  void set_cutter_feed(int lines);
  int cutter_feed() const;

  void clear_hardware_buffer();
  bool is_printer_busy();
  PaperStatus check_paper_status();
  bool connected() const { return escpos_.connected(); }

  // receives each composed canvas in reading order, before rotation
  void set_preview_sink(PreviewSink sink);

  const Renderer& renderer() const { return renderer_; }

private:
  void append(PrintOp op);
  void flush_locked();
  void apply_line_budget(std::vector<PrintOp>& ops);

  PrinterConfig cfg_;
  EscPos escpos_;
  Renderer renderer_;

  mutable std::mutex mu_;
  std::vector<PrintOp> buffer_;
  int max_lines_ = 0;
  int lines_buffered_ = 0;   // text lines appended since reset_buffer
  int lines_flushed_ = 0;    // text lines already sent in this job
  bool truncated_ = false;
  PreviewSink preview_;
};
