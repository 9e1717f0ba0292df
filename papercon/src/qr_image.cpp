#include "qr_image.hpp"
#include <qrcodegen.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

QrEcc qr_ecc_from_char(char c){
  switch (std::toupper(static_cast<unsigned char>(c))){
    case 'L': return QrEcc::Low;
    case 'Q': return QrEcc::Quartile;
    case 'H': return QrEcc::High;
    default:  return QrEcc::Medium;
  }
}

namespace {
qrcodegen_Ecc to_qrcodegen(QrEcc e){
  switch (e){
    case QrEcc::Low:      return qrcodegen_Ecc_LOW;
    case QrEcc::Medium:   return qrcodegen_Ecc_MEDIUM;
    case QrEcc::Quartile: return qrcodegen_Ecc_QUARTILE;
    case QrEcc::High:     return qrcodegen_Ecc_HIGH;
  }
  return qrcodegen_Ecc_MEDIUM;
}
}

std::optional<Bitmap> make_qr_image(const std::string& data, int module_px, QrEcc ecc, bool fixed_size){
  if (data.empty()) return std::nullopt;

  std::vector<uint8_t> qr(qrcodegen_BUFFER_LEN_MAX), tmp(qrcodegen_BUFFER_LEN_MAX);
  bool ok = qrcodegen_encodeText(data.c_str(), tmp.data(), qr.data(), to_qrcodegen(ecc),
                                 qrcodegen_VERSION_MIN, qrcodegen_VERSION_MAX,
                                 qrcodegen_Mask_AUTO, false);
  if (!ok) return std::nullopt;

  int modules = qrcodegen_getSize(qr.data());
  int border = 1;
  int span = modules + 2 * border;

  if (fixed_size){
    Bitmap out(kQrFixedSize, kQrFixedSize);
    for (int y = 0; y < kQrFixedSize; ++y){
      int my = y * span / kQrFixedSize - border;
      for (int x = 0; x < kQrFixedSize; ++x){
        int mx = x * span / kQrFixedSize - border;
        if (qrcodegen_getModule(qr.data(), mx, my)) out.set(x, y);
      }
    }
    return out;
  }

  int px = std::clamp(module_px, 1, 16);
  Bitmap out(span * px, span * px);
  for (int my = 0; my < modules; ++my)
    for (int mx = 0; mx < modules; ++mx)
      if (qrcodegen_getModule(qr.data(), mx, my))
        out.fill_rect((mx + border) * px, (my + border) * px, px, px);
  return out;
}
