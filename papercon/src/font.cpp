#include "font.hpp"
#include <sstream>

namespace {

const unsigned char kFont[95][5] = {
  {0x00,0x00,0x00,0x00,0x00}, {0x00,0x00,0x5F,0x00,0x00}, {0x00,0x07,0x00,0x07,0x00}, // space ! "
  {0x14,0x7F,0x14,0x7F,0x14}, {0x24,0x2A,0x7F,0x2A,0x12}, {0x23,0x13,0x08,0x64,0x62}, // # $ %
  {0x36,0x49,0x55,0x22,0x50}, {0x00,0x05,0x03,0x00,0x00}, {0x00,0x1C,0x22,0x41,0x00}, // & ' (
  {0x00,0x41,0x22,0x1C,0x00}, {0x08,0x2A,0x1C,0x2A,0x08}, {0x08,0x08,0x3E,0x08,0x08}, // ) * +
  {0x00,0x50,0x30,0x00,0x00}, {0x08,0x08,0x08,0x08,0x08}, {0x00,0x60,0x60,0x00,0x00}, // , - .
  {0x20,0x10,0x08,0x04,0x02}, {0x3E,0x51,0x49,0x45,0x3E}, {0x00,0x42,0x7F,0x40,0x00}, // / 0 1
  {0x42,0x61,0x51,0x49,0x46}, {0x21,0x41,0x45,0x4B,0x31}, {0x18,0x14,0x12,0x7F,0x10}, // 2 3 4
  {0x27,0x45,0x45,0x45,0x39}, {0x3C,0x4A,0x49,0x49,0x30}, {0x01,0x71,0x09,0x05,0x03}, // 5 6 7
  {0x36,0x49,0x49,0x49,0x36}, {0x06,0x49,0x49,0x29,0x1E}, {0x00,0x36,0x36,0x00,0x00}, // 8 9 :
  {0x00,0x56,0x36,0x00,0x00}, {0x08,0x14,0x22,0x41,0x00}, {0x14,0x14,0x14,0x14,0x14}, // ; < =
  {0x00,0x41,0x22,0x14,0x08}, {0x02,0x01,0x51,0x09,0x06}, {0x32,0x49,0x79,0x41,0x3E}, // > ? @
  {0x7E,0x11,0x11,0x11,0x7E}, {0x7F,0x49,0x49,0x49,0x36}, {0x3E,0x41,0x41,0x41,0x22}, // A B C
  {0x7F,0x41,0x41,0x22,0x1C}, {0x7F,0x49,0x49,0x49,0x41}, {0x7F,0x09,0x09,0x09,0x01}, // D E F
  {0x3E,0x41,0x49,0x49,0x7A}, {0x7F,0x08,0x08,0x08,0x7F}, {0x00,0x41,0x7F,0x41,0x00}, // G H I
  {0x20,0x40,0x41,0x3F,0x01}, {0x7F,0x08,0x14,0x22,0x41}, {0x7F,0x40,0x40,0x40,0x40}, // J K L
  {0x7F,0x02,0x0C,0x02,0x7F}, {0x7F,0x04,0x08,0x10,0x7F}, {0x3E,0x41,0x41,0x41,0x3E}, // M N O
  {0x7F,0x09,0x09,0x09,0x06}, {0x3E,0x41,0x51,0x21,0x5E}, {0x7F,0x09,0x19,0x29,0x46}, // P Q R
  {0x46,0x49,0x49,0x49,0x31}, {0x01,0x01,0x7F,0x01,0x01}, {0x3F,0x40,0x40,0x40,0x3F}, // S T U
  {0x1F,0x20,0x40,0x20,0x1F}, {0x3F,0x40,0x38,0x40,0x3F}, {0x63,0x14,0x08,0x14,0x63}, // V W X
  {0x07,0x08,0x70,0x08,0x07}, {0x61,0x51,0x49,0x45,0x43}, {0x00,0x7F,0x41,0x41,0x00}, // Y Z [
  {0x02,0x04,0x08,0x10,0x20}, {0x00,0x41,0x41,0x7F,0x00}, {0x04,0x02,0x01,0x02,0x04}, // \ ] ^
  {0x40,0x40,0x40,0x40,0x40}, {0x00,0x01,0x02,0x04,0x00}, {0x20,0x54,0x54,0x54,0x78}, // _ ` a
  {0x7F,0x48,0x44,0x44,0x38}, {0x38,0x44,0x44,0x44,0x20}, {0x38,0x44,0x44,0x48,0x7F}, // b c d
  {0x38,0x54,0x54,0x54,0x18}, {0x08,0x7E,0x09,0x01,0x02}, {0x0C,0x52,0x52,0x52,0x3E}, // e f g
  {0x7F,0x08,0x04,0x04,0x78}, {0x00,0x44,0x7D,0x40,0x00}, {0x20,0x40,0x44,0x3D,0x00}, // h i j
  {0x7F,0x10,0x28,0x44,0x00}, {0x00,0x41,0x7F,0x40,0x00}, {0x7C,0x04,0x18,0x04,0x78}, // k l m
  {0x7C,0x08,0x04,0x04,0x78}, {0x38,0x44,0x44,0x44,0x38}, {0x7C,0x14,0x14,0x14,0x08}, // n o p
  {0x08,0x14,0x14,0x18,0x7C}, {0x7C,0x08,0x04,0x04,0x08}, {0x48,0x54,0x54,0x54,0x20}, // q r s
  {0x04,0x3F,0x44,0x40,0x20}, {0x3C,0x40,0x40,0x20,0x7C}, {0x1C,0x20,0x40,0x20,0x1C}, // t u v
  {0x3C,0x40,0x30,0x40,0x3C}, {0x44,0x28,0x10,0x28,0x44}, {0x0C,0x50,0x50,0x50,0x3C}, // w x y
  {0x44,0x64,0x54,0x4C,0x44}, {0x00,0x08,0x36,0x41,0x00}, {0x00,0x00,0x7F,0x00,0x00}, // z { |
  {0x00,0x41,0x36,0x08,0x00}, {0x02,0x01,0x02,0x04,0x02},                             // } ~
};

}

const char* to_string(TextStyle s){
  switch (s){
    case TextStyle::Regular:      return "regular";
    case TextStyle::Bold:         return "bold";
    case TextStyle::Semibold:     return "semibold";
    case TextStyle::Medium:       return "medium";
    case TextStyle::Light:        return "light";
    case TextStyle::RegularSmall: return "regular_sm";
    case TextStyle::BoldLarge:    return "bold_lg";
  }
  return "regular";
}

StyleMetrics style_metrics(TextStyle s){
  switch (s){
    case TextStyle::Regular:
    case TextStyle::Medium:       return {10, 14, 12, 22, false};
    case TextStyle::Bold:
    case TextStyle::Semibold:     return {10, 14, 12, 22, true};
    case TextStyle::Light:
    case TextStyle::RegularSmall: return {8, 11, 10, 19, false};
    case TextStyle::BoldLarge:    return {15, 21, 18, 28, true};
  }
  return {10, 14, 12, 22, false};
}

const unsigned char* font5x7::glyph(char c){
  auto u = static_cast<unsigned char>(c);
  if (u < 0x20 || u > 0x7E) return kFont[0];
  return kFont[u - 0x20];
}

void draw_glyph(Bitmap& bmp, int x, int y, char c, int w, int h, bool bold){
  if (w <= 0 || h <= 0) return;
  const unsigned char* cols = font5x7::glyph(c);
  for (int py = 0; py < h; ++py){
    int row = py * font5x7::kRows / h;
    for (int px = 0; px < w; ++px){
      int col = px * font5x7::kCols / w;
      if (cols[col] & (1u << row)){
        bmp.set(x + px, y + py);
        if (bold) bmp.set(x + px + 1, y + py);
      }
    }
  }
}

int text_width(const std::string& text, TextStyle s){
  if (text.empty()) return 0;
  StyleMetrics m = style_metrics(s);
  int n = static_cast<int>(text.size());
  return n * m.advance - (m.advance - m.glyph_w) + (m.bold ? 1 : 0);
}

int draw_text(Bitmap& bmp, int x, int y, const std::string& text, TextStyle s){
  StyleMetrics m = style_metrics(s);
  int top = y + (m.line_height - m.glyph_h) / 2;
  for (char c : text){
    draw_glyph(bmp, x, top, c, m.glyph_w, m.glyph_h, m.bold);
    x += m.advance;
  }
  return x;
}

std::vector<std::string> wrap_text(const std::string& paragraph, TextStyle s, int max_width){
  std::vector<std::string> lines;
  std::istringstream in(paragraph);
  std::string word, cur;

  while (in >> word){
    std::string test = cur.empty() ? word : cur + " " + word;
    if (text_width(test, s) <= max_width){
      cur = test;
      continue;
    }
    if (!cur.empty()) lines.push_back(cur);
    if (text_width(word, s) <= max_width){
      cur = word;
      continue;
    }
    // too long for any line (URLs): break per character
    cur.clear();
    for (char c : word){
      std::string t = cur + c;
      if (!cur.empty() && text_width(t, s) > max_width){
        lines.push_back(cur);
        cur = std::string(1, c);
      } else {
        cur = t;
      }
    }
  }
  if (!cur.empty() || lines.empty()) lines.push_back(cur);
  return lines;
}
