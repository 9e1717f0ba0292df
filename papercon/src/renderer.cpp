#include "renderer.hpp"
#include "font.hpp"
#include "graphics.hpp"
#include "log.hpp"
#include "qr_image.hpp"
#include "text_sanitize.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

int box_height(const Box& b){
  return 2 * b.border + 2 * b.padding + style_metrics(b.style).line_height;
}

// sizes come from content modules; compute wide and reject before narrowing
int checked_height(long long h, const char* what){
  if (h < 0 || h > kMaxOpHeight)
    throw std::invalid_argument(std::string(what) + " height " + std::to_string(h) + " out of range");
  return static_cast<int>(h);
}

std::optional<Bitmap> qr_bitmap(const Qr& q){
  return make_qr_image(q.data, q.size, qr_ecc_from_char(q.error_correction), q.fixed_size);
}
}

std::vector<std::string> Renderer::text_lines(const StyledText& t) const {
  std::vector<std::string> out;
  std::string clean = sanitize_text(t.text);
  std::istringstream in(clean);
  std::string para;
  // getline drops a trailing empty paragraph; count newlines explicitly
  size_t paragraphs = 1 + static_cast<size_t>(std::count(clean.begin(), clean.end(), '\n'));
  for (size_t i = 0; i < paragraphs; ++i){
    if (!std::getline(in, para)) para.clear();
    auto lines = wrap_text(para, t.style, width_ - 2 * kTextMargin);
    out.insert(out.end(), lines.begin(), lines.end());
  }
  return out;
}

Renderer::Placed Renderer::layout(const PrintOp& op) const {
  Placed p;
  std::visit(overloaded{
    [&](const StyledText& t){
      long long h = static_cast<long long>(text_lines(t).size()) * style_metrics(t.style).line_height;
      if (h > kMaxCanvasRows) throw std::invalid_argument("text block taller than a job");
      p.height = static_cast<int>(h);
    },
    [&](const Box& b){
      if (b.border < 0 || b.padding < 0) throw std::invalid_argument("negative box border or padding");
      checked_height(2LL * b.border + 2LL * b.padding + style_metrics(b.style).line_height, "box");
      p.height = 2 + box_height(b) + kSpacingMedium;
    },
    [&](const Moon& m){
      if (m.size <= 0) throw std::invalid_argument("moon size must be positive");
      if (!std::isfinite(m.phase)) throw std::invalid_argument("moon phase must be finite");
      if (m.size > width_) throw std::invalid_argument("moon wider than the paper");
      p.height = kSpacingSmall + m.size + kSpacingMedium;
    },
    [&](const Maze& m){
      check_maze_grid(m.grid, m.cell_size);
      if (static_cast<long long>(m.grid.front().size()) * m.cell_size > width_)
        throw std::invalid_argument("maze wider than the paper");
      p.height = kSpacingSmall + checked_height(static_cast<long long>(m.grid.size()) * m.cell_size, "maze")
                 + kSpacingMedium;
    },
    [&](const Sudoku& s){
      check_sudoku_grid(s.grid, s.cell_size);
      if (9LL * s.cell_size + 4 > width_) throw std::invalid_argument("sudoku wider than the paper");
      p.height = kSpacingSmall + sudoku_extent(s.cell_size) + kSpacingMedium;
    },
    [&](const Qr& q){
      p.image = qr_bitmap(q);
      if (!p.image) throw std::runtime_error("QR data empty or too long");
      p.height = p.image->height() + kSpacingSmall;
    },
    [&](const Feed& f){
      p.height = checked_height(static_cast<long long>(std::max(0, f.lines)) * kFeedLineHeight, "feed");
    },
  }, op);
  return p;
}

int Renderer::op_height(const PrintOp& op) const {
  try {
    return layout(op).height;
  } catch (const std::exception& e){
    log_warn("render") << "skipping " << op_name(op) << ": " << e.what();
    return 0;
  }
}

int Renderer::total_height(const std::vector<PrintOp>& ops) const {
  int h = 0;
  for (const auto& op : ops){
    int oh = op_height(op);
    if (h + oh > kMaxCanvasRows) continue;
    h += oh;
  }
  return h;
}

void Renderer::draw(Bitmap& canvas, int y, const PrintOp& op, const Placed& p) const {
  std::visit(overloaded{
    [&](const StyledText& t){
      int lh = style_metrics(t.style).line_height;
      for (const auto& line : text_lines(t)){
        draw_text(canvas, kTextMargin, y, line, t.style);
        y += lh;
      }
    },
    [&](const Box& b){
      int bx = 2, by = y + 2;
      int bw = width_ - kSpacingSmall;
      int bh = box_height(b);
      canvas.fill_rect(bx, by, bw, bh);
      canvas.fill_rect(bx + b.border, by + b.border, bw - 2 * b.border, bh - 2 * b.border, false);
      std::string text = sanitize_text(b.text);
      std::replace(text.begin(), text.end(), '\n', ' ');
      int tw = text_width(text, b.style);
      int tx = bx + std::max(b.border + b.padding, (bw - tw) / 2);
      draw_text(canvas, tx, by + b.border + b.padding, text, b.style);
    },
    [&](const Moon& m){
      draw_moon(canvas, (width_ - m.size) / 2, y + kSpacingSmall, m.size, m.phase);
    },
    [&](const Maze& m){
      int mw = static_cast<int>(m.grid.front().size()) * m.cell_size;
      draw_maze(canvas, (width_ - mw) / 2, y + kSpacingSmall, m.grid, m.cell_size);
    },
    [&](const Sudoku& s){
      int ext = sudoku_extent(s.cell_size);
      draw_sudoku(canvas, (width_ - ext) / 2, y + kSpacingSmall, s.grid, s.cell_size);
    },
    [&](const Qr&){
      const Bitmap& img = *p.image;
      canvas.blit(img, (width_ - img.width()) / 2, y + 2);
    },
    [&](const Feed&){},
  }, op);
}

Bitmap Renderer::compose(const std::vector<PrintOp>& ops) const {
  std::vector<Placed> placed;
  placed.reserve(ops.size());
  int total = 0;
  for (const auto& op : ops){
    Placed p;
    try {
      p = layout(op);
    } catch (const std::exception& e){
      log_warn("render") << "skipping " << op_name(op) << ": " << e.what();
      p.height = 0;
      p.ok = false;
    }
    if (total + p.height > kMaxCanvasRows){
      log_warn("render") << "skipping " << op_name(op) << ": job taller than " << kMaxCanvasRows << " rows";
      p.height = 0;
      p.ok = false;
    }
    total += p.height;
    placed.push_back(std::move(p));
  }
  if (total <= 0) return Bitmap();

  Bitmap canvas(width_, total);
  int y = 0;
  for (size_t i = 0; i < ops.size(); ++i){
    if (placed[i].ok){
      try {
        draw(canvas, y, ops[i], placed[i]);
      } catch (const std::exception& e){
        log_warn("render") << "drawing " << op_name(ops[i]) << " failed: " << e.what();
      }
    }
    y += placed[i].height;
  }
  return canvas;
}
