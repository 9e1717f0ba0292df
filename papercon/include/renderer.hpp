#pragma once
#include <optional>
#include <vector>

#include "bitmap.hpp"
#include "print_ops.hpp"

constexpr int kPrinterWidth = 384;   // dots per row on a 58 mm head
constexpr int kSpacingSmall = 4;
constexpr int kSpacingMedium = 8;
constexpr int kSpacingLarge = 16;
constexpr int kFeedLineHeight = 22;
constexpr int kTextMargin = 2;
// tallest single graphic or feed; larger sizes are rejected in layout
constexpr int kMaxOpHeight = 0xFFFF;
// rows in one canvas; operations past this are skipped
constexpr int kMaxCanvasRows = 1 << 20;

// Turns a list of print operations into one canvas in reading order.
// Layout and drawing are two passes over the same list; an operation that
// fails in either pass is logged and left blank, the rest of the job is
// unaffected. A job taller than kMaxCanvasRows keeps the operations that fit.
class Renderer {
public:
  explicit Renderer(int width = kPrinterWidth) : width_(width) {}

  int width() const { return width_; }

  // vertical space the operation occupies, spacing included
  int op_height(const PrintOp& op) const;
  // sum of op_height over the list; the canvas height of compose()
  int total_height(const std::vector<PrintOp>& ops) const;

  // empty bitmap for an empty list
  Bitmap compose(const std::vector<PrintOp>& ops) const;

private:
  struct Placed {
    int height = 0;
    bool ok = true;
    std::optional<Bitmap> image;  // pre-rendered QR
  };

  Placed layout(const PrintOp& op) const;
  void draw(Bitmap& canvas, int y, const PrintOp& op, const Placed& p) const;

  std::vector<std::string> text_lines(const StyledText& t) const;

  int width_;
};
