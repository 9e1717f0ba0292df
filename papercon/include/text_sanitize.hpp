#pragma once
#include <string>

// Reduces UTF-8 text to printable ASCII plus '\n'. Typographic characters and
// accented Latin letters are transliterated, tabs become spaces, everything
// else (including malformed sequences) is dropped.
std::string sanitize_text(const std::string& utf8);
