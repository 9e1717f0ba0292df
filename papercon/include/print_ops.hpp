#pragma once
#include <string>
#include <variant>
#include <vector>

#include "font.hpp"

using Grid = std::vector<std::vector<int>>;

struct StyledText {
  std::string text;
  TextStyle style = TextStyle::Regular;
};

struct Box {
  std::string text;
  TextStyle style = TextStyle::BoldLarge;
  int padding = 8;
  int border = 2;
};

struct Moon {
  double phase = 0.0;  // 0..28 day cycle
  int size = 60;
};

struct Maze {
  Grid grid;           // 1 = wall, 0 = path
  int cell_size = 8;
};

struct Sudoku {
  Grid grid;           // 9x9, 0 = empty
  int cell_size = 16;
};

struct Qr {
  std::string data;
  int size = 4;        // dots per module
  char error_correction = 'M';
  bool fixed_size = false;
};

struct Feed {
  int lines = 1;
};

using PrintOp = std::variant<StyledText, Box, Moon, Maze, Sudoku, Qr, Feed>;

const char* op_name(const PrintOp& op);

// 1 + newlines for StyledText, 0 for everything else
int text_line_count(const PrintOp& op);
