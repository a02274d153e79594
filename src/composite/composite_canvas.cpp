#include "gvpreview/composite/composite_canvas.hpp"
#include "gvpreview/core/errors.hpp"

#include <limits>
#include <string>

namespace gvpreview::composite {

namespace {

std::string shape_string(int rows, int cols, int channels) {
    return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ", " +
           std::to_string(channels) + ")";
}

} // namespace

CompositeCanvas::CompositeCanvas(const GridDims& grid, const CellSize& cell)
    : grid_(grid), cell_(cell) {
    if (grid.rows <= 0 || grid.cols <= 0) {
        throw ConfigError("grid dimensions must be positive, got " +
                          std::to_string(grid.rows) + "x" + std::to_string(grid.cols));
    }
    if (cell.height <= 0 || cell.width <= 0) {
        throw ConfigError("sub-image size must be positive, got " +
                          std::to_string(cell.height) + "x" + std::to_string(cell.width));
    }

    const long long total_rows = static_cast<long long>(grid.rows) * cell.height;
    const long long total_cols = static_cast<long long>(grid.cols) * cell.width;
    if (total_rows > std::numeric_limits<int>::max() ||
        total_cols > std::numeric_limits<int>::max()) {
        throw ConfigError("composite image would be too large");
    }

    raster_ = cv::Mat::zeros(static_cast<int>(total_rows), static_cast<int>(total_cols), CV_8UC3);
}

void CompositeCanvas::paste(int row, int col, const cv::Mat& image) {
    if (row < 0 || row >= grid_.rows || col < 0 || col >= grid_.cols) {
        throw IndexOutOfRange("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                              ") is outside a " + std::to_string(grid_.rows) + "x" +
                              std::to_string(grid_.cols) + " grid");
    }
    if (image.rows != cell_.height || image.cols != cell_.width || image.type() != CV_8UC3) {
        throw ShapeMismatch("sub-image has shape " +
                            shape_string(image.rows, image.cols, image.channels()) +
                            ", expected " + shape_string(cell_.height, cell_.width, 3) +
                            " of 8-bit samples");
    }

    cv::Mat dst = raster_(cv::Rect(col * cell_.width, row * cell_.height, cell_.width, cell_.height));
    image.copyTo(dst);
}

cv::Mat CompositeCanvas::cell_view(int row, int col) const {
    if (row < 0 || row >= grid_.rows || col < 0 || col >= grid_.cols) {
        throw IndexOutOfRange("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                              ") is outside the grid");
    }
    return raster_(cv::Rect(col * cell_.width, row * cell_.height, cell_.width, cell_.height));
}

uint64_t CompositeCanvas::pixel_sum() const {
    const cv::Scalar s = cv::sum(raster_);
    return static_cast<uint64_t>(s[0] + s[1] + s[2]);
}

} // namespace gvpreview::composite
