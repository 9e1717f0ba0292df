#include "print_ops.hpp"
#include <algorithm>

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

const char* op_name(const PrintOp& op){
  return std::visit(overloaded{
    [](const StyledText&){ return "text"; },
    [](const Box&)       { return "box"; },
    [](const Moon&)      { return "moon"; },
    [](const Maze&)      { return "maze"; },
    [](const Sudoku&)    { return "sudoku"; },
    [](const Qr&)        { return "qr"; },
    [](const Feed&)      { return "feed"; },
  }, op);
}

int text_line_count(const PrintOp& op){
  if (auto t = std::get_if<StyledText>(&op))
    return 1 + static_cast<int>(std::count(t->text.begin(), t->text.end(), '\n'));
  return 0;
}
