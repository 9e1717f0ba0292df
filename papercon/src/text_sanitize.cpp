#include "text_sanitize.hpp"
#include <cstdint>

namespace {

const char* replacement(uint32_t cp){
  switch (cp){
    case 0x201C: case 0x201D: case 0x201E: return "\"";
    case 0x2018: case 0x2019: case 0x201A: return "'";
    case 0x2013: case 0x2014: case 0x2212: return "-";
    case 0x2026: return "...";
    case 0x2022: case 0x00B7: return "*";
    case 0x00B0: return "o";
    case 0x00A9: return "(c)";
    case 0x00AE: return "(R)";
    case 0x2122: return "(TM)";
    case 0x00D7: return "x";
    case 0x00F7: return "/";
    case 0x20AC: return "EUR";
    case 0x00A3: return "GBP";
    case 0x00A5: return "JPY";
    case 0x00A0: return " ";
    case 0x200B: case 0x200C: case 0x200D: case 0xFEFF: return "";
    case 0x00C6: return "AE";
    case 0x00E6: return "ae";
    case 0x00DF: return "ss";
    case 0x0152: return "OE";
    case 0x0153: return "oe";
    case 0x00AB: return "<<";
    case 0x00BB: return ">>";
  }
  return nullptr;
}

// base letters for U+00C0..U+00FF, 0 = no substitution
const char kLatin1Fold[64] = {
  'A','A','A','A','A','A', 0 ,'C','E','E','E','E','I','I','I','I',
  'D','N','O','O','O','O','O', 0 ,'O','U','U','U','U','Y', 0 , 0 ,
  'a','a','a','a','a','a', 0 ,'c','e','e','e','e','i','i','i','i',
  'd','n','o','o','o','o','o', 0 ,'o','u','u','u','u','y', 0 ,'y',
};

// decodes one code point; advances i; returns false on a malformed sequence
bool next_code_point(const std::string& s, size_t& i, uint32_t& cp){
  auto b = static_cast<unsigned char>(s[i]);
  int extra;
  if (b < 0x80){ cp = b; extra = 0; }
  else if ((b & 0xE0) == 0xC0){ cp = b & 0x1F; extra = 1; }
  else if ((b & 0xF0) == 0xE0){ cp = b & 0x0F; extra = 2; }
  else if ((b & 0xF8) == 0xF0){ cp = b & 0x07; extra = 3; }
  else { ++i; return false; }
  ++i;
  for (int k = 0; k < extra; ++k){
    if (i >= s.size()) return false;
    auto c = static_cast<unsigned char>(s[i]);
    if ((c & 0xC0) != 0x80) return false;
    cp = (cp << 6) | (c & 0x3F);
    ++i;
  }
  return true;
}

}

std::string sanitize_text(const std::string& utf8){
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()){
    uint32_t cp = 0;
    if (!next_code_point(utf8, i, cp)) continue;
    if (cp >= 0x20 && cp <= 0x7E){ out.push_back(static_cast<char>(cp)); continue; }
    if (cp == '\n'){ out.push_back('\n'); continue; }
    if (cp == '\t'){ out.push_back(' '); continue; }
    if (const char* r = replacement(cp)){ out += r; continue; }
    if (cp >= 0xC0 && cp <= 0xFF && kLatin1Fold[cp - 0xC0]) out.push_back(kLatin1Fold[cp - 0xC0]);
  }
  return out;
}
