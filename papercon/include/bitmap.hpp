#pragma once
#include <cstdint>
#include <vector>

// 1-bit canvas, one byte per dot (1 = black). Writes outside the canvas are
// clipped.
class Bitmap {
public:
  Bitmap() = default;
  Bitmap(int width, int height);

  int width() const { return w_; }
  int height() const { return h_; }
  bool empty() const { return w_ == 0 || h_ == 0; }

  bool get(int x, int y) const;
  void set(int x, int y, bool black = true);

  void fill_rect(int x, int y, int w, int h, bool black = true);
  // outline of thickness t drawn inside the rectangle
  void draw_rect(int x, int y, int w, int h, int t = 1);
  // square brush of side t
  void draw_line(int x0, int y0, int x1, int y1, int t = 1);
  // ring of thickness t inside the circle's bounding box (diameter d)
  void draw_circle(int x, int y, int d, int t = 1);
  void blit(const Bitmap& src, int x, int y);

  Bitmap rotated_180() const;
  // MSB-first rows, 8 dots per byte, width padded to a multiple of 8
  std::vector<uint8_t> pack_rows() const;
  int bytes_per_row() const { return (w_ + 7) / 8; }

private:
  int w_ = 0;
  int h_ = 0;
  std::vector<uint8_t> px_;
};
