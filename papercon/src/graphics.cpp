#include "graphics.hpp"
#include "font.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr int kRing = 2;

bool inside(int px, int py, int cx, int cy, int r){
  int dx = px - cx, dy = py - cy;
  return dx * dx + dy * dy <= r * r;
}

void fill_disc(Bitmap& bmp, int cx, int cy, int r, bool black){
  for (int py = cy - r; py <= cy + r; ++py)
    for (int px = cx - r; px <= cx + r; ++px)
      if (inside(px, py, cx, cy, r)) bmp.set(px, py, black);
}
}

void draw_moon(Bitmap& bmp, int x, int y, int size, double phase){
  if (size <= 2 * kRing) throw std::invalid_argument("moon size too small");
  if (!std::isfinite(phase)) throw std::invalid_argument("moon phase must be finite");

  double norm = std::fmod(phase, 28.0);
  if (norm < 0) norm += 28.0;
  norm /= 28.0;
  double illum = (1.0 - std::cos(norm * 2.0 * kPi)) / 2.0;

  int cx = x + size / 2, cy = y + size / 2;
  int inner = size / 2 - kRing;

  // new moon: dark disc
  if (illum < 0.01){
    fill_disc(bmp, cx, cy, size / 2, true);
    return;
  }

  // lit disc inside a black ring, then shade the dark side
  fill_disc(bmp, cx, cy, size / 2, true);
  fill_disc(bmp, cx, cy, inner, false);

  // terminator column; the dark side shrinks towards the limb as illumination grows
  bool waxing = norm < 0.5;
  double sweep = (illum * 2.0 - 1.0) * inner;
  double term = waxing ? cx - sweep : cx + sweep;
  for (int py = cy - inner; py <= cy + inner; ++py){
    for (int px = cx - inner; px <= cx + inner; ++px){
      if (!inside(px, py, cx, cy, inner)) continue;
      bool shadow = waxing ? (px < term) : (px > term);
      if (shadow) bmp.set(px, py);
    }
  }

  // a few deterministic craters on the lit side
  std::mt19937 rng(static_cast<unsigned>(norm * 2800.0));
  std::uniform_real_distribution<double> angle_d(0.0, 2.0 * kPi);
  std::uniform_real_distribution<double> dist_d(0.0, inner * 0.7);
  std::uniform_int_distribution<int> r_d(1, std::max(1, size / 30));
  int craters = std::max(3, size / 20);
  for (int i = 0; i < craters; ++i){
    double a = angle_d(rng), d = dist_d(rng);
    int r = r_d(rng);
    int kx = static_cast<int>(cx + d * std::cos(a));
    int ky = static_cast<int>(cy + d * std::sin(a));
    bool lit = waxing ? (kx > term) : (kx < term);
    if (lit && inside(kx, ky, cx, cy, inner)) fill_disc(bmp, kx, ky, r, true);
  }

  bmp.draw_circle(x, y, size, kRing);
}

void check_maze_grid(const Grid& grid, int cell){
  if (grid.empty() || grid.front().empty()) throw std::invalid_argument("empty maze grid");
  if (cell <= 0) throw std::invalid_argument("maze cell size must be positive");
  for (const auto& row : grid)
    if (row.size() != grid.front().size()) throw std::invalid_argument("ragged maze grid");
}

void draw_maze(Bitmap& bmp, int x, int y, const Grid& grid, int cell){
  check_maze_grid(grid, cell);
  const int rows = static_cast<int>(grid.size());
  const int cols = static_cast<int>(grid.front().size());

  for (int r = 0; r < rows; ++r){
    for (int c = 0; c < cols; ++c){
      if (grid[r][c] != 1) continue;
      int cx = x + c * cell, cy = y + r * cell;
      for (int py = 0; py < cell; ++py)
        for (int px = 0; px < cell; ++px)
          if ((px + py) % 2 == 0) bmp.set(cx + px, cy + py);
    }
  }

  if (cols < 2) return;
  const int arrow = 3;
  const int half = cell / 2;

  int ax = x + 1 * cell + half;
  int ay = y + half;
  bmp.draw_line(ax, y, ax, ay, 2);
  bmp.draw_line(ax, ay, ax - arrow, ay - arrow, 2);
  bmp.draw_line(ax, ay, ax + arrow, ay - arrow, 2);

  int ex = x + (cols - 2) * cell + half;
  int ey = y + (rows - 1) * cell + (cell - half);
  bmp.draw_line(ex, ey - half, ex, ey, 2);
  bmp.draw_line(ex, ey, ex - arrow, ey + arrow, 2);
  bmp.draw_line(ex, ey, ex + arrow, ey + arrow, 2);
}

int sudoku_extent(int cell){ return 9 * cell + 4; }

void check_sudoku_grid(const Grid& grid, int cell){
  if (grid.size() != 9) throw std::invalid_argument("sudoku grid must have 9 rows");
  for (const auto& row : grid){
    if (row.size() != 9) throw std::invalid_argument("sudoku row must have 9 cells");
    for (int v : row)
      if (v < 0 || v > 9) throw std::invalid_argument("sudoku value out of range: " + std::to_string(v));
  }
  if (cell < 4) throw std::invalid_argument("sudoku cell size too small");
}

void draw_sudoku(Bitmap& bmp, int x, int y, const Grid& grid, int cell){
  check_sudoku_grid(grid, cell);

  const int heavy = 2;
  const int x0 = x + heavy, y0 = y + heavy;
  const int span = 9 * cell;

  bmp.draw_rect(x, y, span + 2 * heavy, span + 2 * heavy, heavy);
  for (int i = 1; i < 9; ++i){
    int t = (i % 3 == 0) ? heavy : 1;
    int off = i * cell - (t - 1) / 2;
    bmp.fill_rect(x0 + off, y0, t, span);
    bmp.fill_rect(x0, y0 + off, span, t);
  }

  // digits use the unscaled 5x7 glyph, doubled when the cell has room
  int scale = (cell >= 16) ? 2 : 1;
  int gw = font5x7::kCols * scale, gh = font5x7::kRows * scale;
  for (int r = 0; r < 9; ++r){
    for (int c = 0; c < 9; ++c){
      int v = grid[r][c];
      if (v == 0) continue;
      int gx = x0 + c * cell + (cell - gw) / 2 + 1;
      int gy = y0 + r * cell + (cell - gh) / 2 + 1;
      draw_glyph(bmp, gx, gy, static_cast<char>('0' + v), gw, gh, false);
    }
  }
}
