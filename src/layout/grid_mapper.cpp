#include "gvpreview/layout/grid_mapper.hpp"
#include "gvpreview/core/errors.hpp"
#include "gvpreview/core/utils.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace gvpreview::layout {

GridPosition index_to_grid_position(int index, int rows, int cols, FillOrder order) {
    if (index < 0) {
        throw IndexOutOfRange("index " + std::to_string(index) + " is negative");
    }
    const long long capacity = static_cast<long long>(std::max(rows, 0)) *
                               static_cast<long long>(std::max(cols, 0));
    if (index >= capacity) {
        throw IndexOutOfRange("index " + std::to_string(index) +
                              " is larger than it should be given " +
                              format_xbyy(rows, cols));
    }

    switch (order) {
        case FillOrder::COLS_RIGHT:
            return {index % rows, index / rows};
        case FillOrder::COLS_LEFT:
            return {index % rows, cols - 1 - index / rows};
        case FillOrder::ROWS_DOWN:
        case FillOrder::ROWS_UP:
            throw UnsupportedOrder(fill_order_to_string(order) + " is not implemented");
    }
    throw UnsupportedOrder("unknown fill order");
}

FillOrder parse_fill_order(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "colsright") return FillOrder::COLS_RIGHT;
    if (norm == "colsleft") return FillOrder::COLS_LEFT;
    if (norm == "rowsdown") return FillOrder::ROWS_DOWN;
    if (norm == "rowsup") return FillOrder::ROWS_UP;
    throw ConfigError("Bad order '" + s + "', expected colsright, colsleft, rowsdown or rowsup");
}

std::pair<int, int> parse_xbyy(const std::string& s) {
    static const std::regex re(R"(^(\d+)x(\d+)$)", std::regex::ECMAScript | std::regex::icase);

    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        throw ConfigError(s + " doesn't appear to be in XxY format");
    }

    try {
        return {std::stoi(m[1].str()), std::stoi(m[2].str())};
    } catch (const std::out_of_range&) {
        throw ConfigError(s + " is too large");
    }
}

GridDims parse_grid_dims(const std::string& s) {
    auto [rows, cols] = parse_xbyy(s);
    return {rows, cols};
}

CellSize parse_cell_size(const std::string& s) {
    auto [height, width] = parse_xbyy(s);
    return {height, width};
}

std::string format_xbyy(int a, int b) {
    return std::to_string(a) + "x" + std::to_string(b);
}

} // namespace gvpreview::layout
