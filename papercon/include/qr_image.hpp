#pragma once
#include <optional>
#include <string>

#include "bitmap.hpp"

enum class QrEcc { Low, Medium, Quartile, High };

// 'L', 'M', 'Q', 'H' (case-insensitive); anything else is Medium
QrEcc qr_ecc_from_char(char c);

constexpr int kQrFixedSize = 80;

// QR symbol with a one-module quiet zone, module_px dots per module (clamped
// to 1..16). fixed_size scales the result to kQrFixedSize square.
// nullopt when the data is empty or does not fit any QR version.
std::optional<Bitmap> make_qr_image(const std::string& data, int module_px, QrEcc ecc, bool fixed_size);
