#pragma once

#include "gvpreview/core/types.hpp"

#include <string>
#include <utility>

namespace gvpreview::layout {

// Map a zero-based sequence index onto a rows x cols grid, origin top-left.
// Throws IndexOutOfRange when index >= rows * cols, UnsupportedOrder for
// ROWS_DOWN and ROWS_UP.
GridPosition index_to_grid_position(int index, int rows, int cols, FillOrder order);

inline GridPosition index_to_grid_position(int index, const GridDims& grid, FillOrder order) {
    return index_to_grid_position(index, grid.rows, grid.cols, order);
}

// "colsright" | "colsleft" | "rowsdown" | "rowsup", case-insensitive.
FillOrder parse_fill_order(const std::string& s);

// Parse "ROWSxCOLS" (e.g. "10x20" or "1X2"). Throws ConfigError.
std::pair<int, int> parse_xbyy(const std::string& s);

GridDims parse_grid_dims(const std::string& s);
CellSize parse_cell_size(const std::string& s);

std::string format_xbyy(int a, int b);

} // namespace gvpreview::layout
