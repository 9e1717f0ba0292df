#include "preview.hpp"
#include <algorithm>

namespace {
bool any_black(const Bitmap& bmp, int x, int y, int scale){
  for (int dx = 0; dx < scale; ++dx)
    if (bmp.get(x + dx, y)) return true;
  return false;
}
}

void write_preview(std::ostream& os, const Bitmap& bmp, int scale){
  scale = std::max(1, scale);
  for (int y = 0; y < bmp.height(); y += 2){
    for (int x = 0; x < bmp.width(); x += scale){
      bool top = any_black(bmp, x, y, scale);
      bool bottom = y + 1 < bmp.height() && any_black(bmp, x, y + 1, scale);
      if (top && bottom) os << "█";
      else if (top) os << "▀";
      else if (bottom) os << "▄";
      else os << ' ';
    }
    os << '\n';
  }
}
