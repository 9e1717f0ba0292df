#pragma once
#include <string>
#include <vector>

#include "bitmap.hpp"

enum class TextStyle {
  Regular,
  Bold,
  Semibold,
  Medium,
  Light,
  RegularSmall,
  BoldLarge
};

const char* to_string(TextStyle s);

struct StyleMetrics {
  int glyph_w;
  int glyph_h;
  int advance;      // glyph_w + inter-character gap
  int line_height;
  bool bold;        // double strike
};

StyleMetrics style_metrics(TextStyle s);

namespace font5x7 {
constexpr int kCols = 5;
constexpr int kRows = 7;
// column bits for printable ASCII (0x20..0x7E), bit 0 = top row
const unsigned char* glyph(char c);
}

// Draws one 5x7 glyph scaled to w x h with nearest-neighbour sampling.
void draw_glyph(Bitmap& bmp, int x, int y, char c, int w, int h, bool bold);

int text_width(const std::string& text, TextStyle s);
// returns the x just past the last glyph
int draw_text(Bitmap& bmp, int x, int y, const std::string& text, TextStyle s);

// Word wrap by pixel width. Words wider than a line are broken per character.
// An empty paragraph yields one empty line.
std::vector<std::string> wrap_text(const std::string& paragraph, TextStyle s, int max_width);
