#include "gvpreview/core/errors.hpp"
#include "gvpreview/layout/grid_mapper.hpp"

#include <catch2/catch_test_macros.hpp>

using gvpreview::ConfigError;
using gvpreview::FillOrder;
using gvpreview::GridPosition;
using gvpreview::IndexOutOfRange;
using gvpreview::UnsupportedOrder;
using namespace gvpreview::layout;

TEST_CASE("colsright_fills_columns_top_to_bottom_then_left_to_right") {
    REQUIRE(index_to_grid_position(10, 5, 5, FillOrder::COLS_RIGHT) == GridPosition{0, 2});
    REQUIRE(index_to_grid_position(1, 5, 5, FillOrder::COLS_RIGHT) == GridPosition{1, 0});
    REQUIRE(index_to_grid_position(0, 5, 5, FillOrder::COLS_RIGHT) == GridPosition{0, 0});
}

TEST_CASE("colsright_matches_modulo_formula_for_every_cell") {
    for (int rows = 1; rows <= 4; ++rows) {
        for (int cols = 1; cols <= 4; ++cols) {
            for (int index = 0; index < rows * cols; ++index) {
                auto pos = index_to_grid_position(index, rows, cols, FillOrder::COLS_RIGHT);
                REQUIRE(pos.row == index % rows);
                REQUIRE(pos.col == index / rows);
            }
        }
    }
}

TEST_CASE("index_at_capacity_is_out_of_range") {
    REQUIRE_THROWS_AS(index_to_grid_position(25, 5, 5, FillOrder::COLS_RIGHT), IndexOutOfRange);
    REQUIRE_THROWS_AS(index_to_grid_position(6, 2, 3, FillOrder::COLS_RIGHT), IndexOutOfRange);
    REQUIRE_THROWS_AS(index_to_grid_position(-1, 2, 3, FillOrder::COLS_RIGHT), IndexOutOfRange);
    REQUIRE_THROWS_AS(index_to_grid_position(0, 0, 3, FillOrder::COLS_RIGHT), IndexOutOfRange);
}

TEST_CASE("colsleft_fills_columns_from_the_right_edge") {
    REQUIRE(index_to_grid_position(0, 2, 3, FillOrder::COLS_LEFT) == GridPosition{0, 2});
    REQUIRE(index_to_grid_position(1, 2, 3, FillOrder::COLS_LEFT) == GridPosition{1, 2});
    REQUIRE(index_to_grid_position(2, 2, 3, FillOrder::COLS_LEFT) == GridPosition{0, 1});
    REQUIRE(index_to_grid_position(5, 2, 3, FillOrder::COLS_LEFT) == GridPosition{1, 0});
}

TEST_CASE("row_orders_are_rejected") {
    REQUIRE_THROWS_AS(index_to_grid_position(0, 2, 2, FillOrder::ROWS_DOWN), UnsupportedOrder);
    REQUIRE_THROWS_AS(index_to_grid_position(0, 2, 2, FillOrder::ROWS_UP), UnsupportedOrder);
}

TEST_CASE("range_check_precedes_order_check") {
    REQUIRE_THROWS_AS(index_to_grid_position(4, 2, 2, FillOrder::ROWS_DOWN), IndexOutOfRange);
}

TEST_CASE("parse_fill_order_is_case_insensitive") {
    REQUIRE(parse_fill_order("colsright") == FillOrder::COLS_RIGHT);
    REQUIRE(parse_fill_order("ColsLeft") == FillOrder::COLS_LEFT);
    REQUIRE(parse_fill_order("ROWSDOWN") == FillOrder::ROWS_DOWN);
    REQUIRE(parse_fill_order("rowsup") == FillOrder::ROWS_UP);
    REQUIRE_THROWS_AS(parse_fill_order("diagonal"), ConfigError);
}

TEST_CASE("parse_xbyy_accepts_either_case_of_x") {
    REQUIRE(parse_xbyy("10x20") == std::make_pair(10, 20));
    REQUIRE(parse_xbyy("1X2") == std::make_pair(1, 2));

    auto cell = parse_cell_size("200x300");
    REQUIRE(cell.height == 200);
    REQUIRE(cell.width == 300);

    auto grid = parse_grid_dims("4x6");
    REQUIRE(grid.rows == 4);
    REQUIRE(grid.cols == 6);
    REQUIRE(grid.capacity() == 24);
}

TEST_CASE("parse_xbyy_requires_the_whole_string_to_match") {
    REQUIRE_THROWS_AS(parse_xbyy("10x20px"), ConfigError);
    REQUIRE_THROWS_AS(parse_xbyy(" 10x20"), ConfigError);
    REQUIRE_THROWS_AS(parse_xbyy("10*20"), ConfigError);
    REQUIRE_THROWS_AS(parse_xbyy("x20"), ConfigError);
    REQUIRE_THROWS_AS(parse_xbyy("-1x2"), ConfigError);
    REQUIRE_THROWS_AS(parse_xbyy("99999999999x2"), ConfigError);
}

TEST_CASE("grid_capacity_does_not_overflow_int") {
    gvpreview::GridDims grid{50000, 50000};
    REQUIRE(grid.capacity() == 2500000000LL);
}
