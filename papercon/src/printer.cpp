#include "printer.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <string>

Printer::Printer(Transport& t, PrinterConfig cfg, EscPosTiming timing)
    : cfg_(cfg), escpos_(t, timing, cfg.paper_sensor), renderer_(cfg.width) {}

void Printer::initialize(){
  escpos_.initialize();
}

void Printer::append(PrintOp op){
  std::lock_guard<std::mutex> lk(mu_);
  if (buffer_.size() >= cfg_.max_ops){
    log_info("printer") << "buffer reached " << cfg_.max_ops << " operations, flushing early";
    flush_locked();
  }
  lines_buffered_ += text_line_count(op);
  buffer_.push_back(std::move(op));
}

void Printer::print_header(const std::string& text){
  std::string up = text;
  std::transform(up.begin(), up.end(), up.begin(),
                 [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  append(Box{up, TextStyle::BoldLarge, 8, 2});
}

void Printer::print_subheader(const std::string& text){ print_text(text, TextStyle::Semibold); }
void Printer::print_body(const std::string& text){ print_text(text, TextStyle::Regular); }
void Printer::print_caption(const std::string& text){ print_text(text, TextStyle::Light); }
void Printer::print_bold(const std::string& text){ print_text(text, TextStyle::Bold); }

void Printer::print_line(){
  const int max_w = cfg_.width - 2 * kTextMargin;
  std::string line = "-";
  while (text_width(line + " -", TextStyle::Light) <= max_w) line += " -";
  print_text(line, TextStyle::Light);
}

void Printer::print_text(const std::string& text, TextStyle style){
  append(StyledText{text, style});
}

void Printer::print_qr(const std::string& data, int size, char error_correction, bool fixed_size){
  append(Qr{data, size, error_correction, fixed_size});
}

void Printer::print_moon_phase(double phase, int size){
  append(Moon{phase, size});
}

void Printer::print_maze(const Grid& grid, int cell_size){
  append(Maze{grid, cell_size});
}

void Printer::print_sudoku(const Grid& grid, int cell_size){
  append(Sudoku{grid, cell_size});
}

void Printer::feed(int lines){
  append(Feed{lines});
}

void Printer::reset_buffer(int max_lines){
  {
    std::lock_guard<std::mutex> lk(mu_);
    buffer_.clear();
    max_lines_ = std::max(0, max_lines);
    lines_buffered_ = 0;
    lines_flushed_ = 0;
    truncated_ = false;
  }
  escpos_.ascii_mode();
}

void Printer::flush_buffer(){
  std::lock_guard<std::mutex> lk(mu_);
  flush_locked();
}

void Printer::apply_line_budget(std::vector<PrintOp>& ops){
  if (max_lines_ <= 0) return;

  int total = 0;
  for (const auto& op : ops) total += text_line_count(op);

  int budget = max_lines_ - lines_flushed_;
  int counted = 0;
  size_t cut = ops.size();
  for (size_t i = 0; i < ops.size(); ++i){
    int n = text_line_count(ops[i]);
    if (n == 0) continue;
    if (counted + n > budget){
      cut = i;
      break;
    }
    counted += n;
  }
  lines_flushed_ += counted;
  if (cut == ops.size()) return;

  ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(cut), ops.end());
  truncated_ = true;
  std::string marker = "-- TRUNCATED (" + std::to_string(max_lines_) + "/" +
                       std::to_string(lines_flushed_ - counted + total) + ") --";
  ops.push_back(StyledText{marker, TextStyle::Regular});
  log_info("printer") << "job truncated at " << max_lines_ << " lines";
}

void Printer::flush_locked(){
  if (buffer_.empty()) return;
  std::vector<PrintOp> ops;
  ops.swap(buffer_);

  if (truncated_){
    log_debug("printer") << "dropping " << ops.size() << " operations after truncation";
    return;
  }
  apply_line_budget(ops);

  Bitmap canvas;
  try {
    canvas = renderer_.compose(ops);
  } catch (const std::exception& e){
    log_error("printer") << "composing " << ops.size() << " operations failed: " << e.what();
    canvas = renderer_.compose({Box{"PRINT ERROR", TextStyle::BoldLarge, 8, 2},
                                StyledText{"could not load this content", TextStyle::Regular}});
  }
  if (canvas.empty()) return;

  if (preview_){
    try {
      preview_(canvas);
    } catch (const std::exception& e){
      log_warn("printer") << "preview sink failed: " << e.what();
    }
  }
  if (!escpos_.print_raster(canvas.rotated_180()) && escpos_.connected())
    log_error("printer") << "raster transfer failed";
}

bool Printer::is_max_lines_exceeded() const {
  std::lock_guard<std::mutex> lk(mu_);
  return max_lines_ > 0 && lines_buffered_ >= max_lines_;
}

bool Printer::was_truncated() const {
  std::lock_guard<std::mutex> lk(mu_);
  return truncated_;
}

std::size_t Printer::buffered_ops() const {
  std::lock_guard<std::mutex> lk(mu_);
  return buffer_.size();
}

void Printer::feed_direct(int lines){ escpos_.feed(lines); }
void Printer::blip(){ escpos_.blip(); }

void Printer::set_cutter_feed(int lines){
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.cutter_feed = std::max(0, lines);
}

int Printer::cutter_feed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_.cutter_feed;
}

void Printer::clear_hardware_buffer(){
  {
    std::lock_guard<std::mutex> lk(mu_);
    buffer_.clear();
    lines_buffered_ = 0;
  }
  escpos_.clear_buffer();
}

bool Printer::is_printer_busy(){ return escpos_.is_busy(); }
PaperStatus Printer::check_paper_status(){ return escpos_.paper_status(); }

void Printer::set_preview_sink(PreviewSink sink){
  std::lock_guard<std::mutex> lk(mu_);
  preview_ = std::move(sink);
}
