#pragma once
#include "bitmap.hpp"
#include "print_ops.hpp"

// Moon of diameter size with its top-left corner at (x, y).
// Illumination is (1 - cos(2*pi*phase/28)) / 2; the shadow sits on the left
// while waxing and on the right while waning.
void draw_moon(Bitmap& bmp, int x, int y, int size, double phase);

// Walls as a 50% checkerboard, paths white, arrows marking the entrance
// (top, second column) and the exit (bottom, second-to-last column).
// Throws std::invalid_argument on an empty or ragged grid.
void draw_maze(Bitmap& bmp, int x, int y, const Grid& grid, int cell);

// 9x9 grid, heavy lines on the 3x3 boundaries, digits centred in cells.
// Throws std::invalid_argument unless the grid is 9x9 with values 0..9.
void draw_sudoku(Bitmap& bmp, int x, int y, const Grid& grid, int cell);

int sudoku_extent(int cell);

// throw std::invalid_argument with the reason a grid cannot be drawn
void check_maze_grid(const Grid& grid, int cell);
void check_sudoku_grid(const Grid& grid, int cell);
