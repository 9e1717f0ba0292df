#pragma once
#include <ostream>

#include "bitmap.hpp"

// Draws the canvas with Unicode half blocks, two dot rows per text row and
// `scale` dot columns per character.
void write_preview(std::ostream& os, const Bitmap& bmp, int scale = 2);
