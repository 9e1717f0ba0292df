#include "bitmap.hpp"
#include <algorithm>
#include <cstdlib>

Bitmap::Bitmap(int width, int height)
    : w_(std::max(0, width)), h_(std::max(0, height)),
      px_(static_cast<size_t>(w_) * static_cast<size_t>(h_), 0) {}

bool Bitmap::get(int x, int y) const {
  if (x < 0 || y < 0 || x >= w_ || y >= h_) return false;
  return px_[static_cast<size_t>(y) * w_ + x] != 0;
}

void Bitmap::set(int x, int y, bool black){
  if (x < 0 || y < 0 || x >= w_ || y >= h_) return;
  px_[static_cast<size_t>(y) * w_ + x] = black ? 1 : 0;
}

void Bitmap::fill_rect(int x, int y, int w, int h, bool black){
  int x0 = std::max(0, x), y0 = std::max(0, y);
  int x1 = std::min(w_, x + w), y1 = std::min(h_, y + h);
  if (x0 >= x1) return;
  for (int yy = y0; yy < y1; ++yy)
    std::fill(px_.begin() + static_cast<size_t>(yy) * w_ + x0,
              px_.begin() + static_cast<size_t>(yy) * w_ + x1, black ? 1 : 0);
}

void Bitmap::draw_rect(int x, int y, int w, int h, int t){
  fill_rect(x, y, w, t);
  fill_rect(x, y + h - t, w, t);
  fill_rect(x, y, t, h);
  fill_rect(x + w - t, y, t, h);
}

void Bitmap::draw_line(int x0, int y0, int x1, int y1, int t){
  int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
  int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  int off = (t - 1) / 2;
  for (;;){
    fill_rect(x0 - off, y0 - off, t, t);
    if (x0 == x1 && y0 == y1) break;
    int e2 = 2 * err;
    if (e2 >= dy){ err += dy; x0 += sx; }
    if (e2 <= dx){ err += dx; y0 += sy; }
  }
}

void Bitmap::draw_circle(int x, int y, int d, int t){
  double r = d / 2.0;
  double ri = r - t;
  double cx = x + r, cy = y + r;
  for (int yy = y; yy < y + d; ++yy){
    for (int xx = x; xx < x + d; ++xx){
      double ddx = xx + 0.5 - cx, ddy = yy + 0.5 - cy;
      double q = ddx * ddx + ddy * ddy;
      if (q <= r * r && q > ri * ri) set(xx, yy);
    }
  }
}

void Bitmap::blit(const Bitmap& src, int x, int y){
  for (int yy = 0; yy < src.h_; ++yy)
    for (int xx = 0; xx < src.w_; ++xx)
      if (src.get(xx, yy)) set(x + xx, y + yy);
}

Bitmap Bitmap::rotated_180() const {
  Bitmap out(w_, h_);
  std::reverse_copy(px_.begin(), px_.end(), out.px_.begin());
  return out;
}

std::vector<uint8_t> Bitmap::pack_rows() const {
  int bpr = bytes_per_row();
  std::vector<uint8_t> out(static_cast<size_t>(bpr) * h_, 0);
  for (int y = 0; y < h_; ++y){
    const uint8_t* row = px_.data() + static_cast<size_t>(y) * w_;
    uint8_t* dst = out.data() + static_cast<size_t>(y) * bpr;
    for (int x = 0; x < w_; ++x)
      if (row[x]) dst[x >> 3] |= static_cast<uint8_t>(0x80 >> (x & 7));
  }
  return out;
}
