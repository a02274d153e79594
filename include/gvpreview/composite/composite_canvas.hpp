#pragma once

#include "gvpreview/core/types.hpp"

#include <cstdint>
#include <opencv2/core.hpp>

namespace gvpreview::composite {

// Black BGR raster of grid.rows x grid.cols cells, each cell.height x cell.width.
// The raster is allocated once and never resized.
class CompositeCanvas {
public:
    CompositeCanvas(const GridDims& grid, const CellSize& cell);

    // Overwrite the cell at (row, col) with image, which must be exactly one
    // CV_8UC3 cell in size. Throws ShapeMismatch or IndexOutOfRange.
    void paste(int row, int col, const cv::Mat& image);

    void paste(const GridPosition& pos, const cv::Mat& image) {
        paste(pos.row, pos.col, image);
    }

    // View of the pixels covered by one cell.
    cv::Mat cell_view(int row, int col) const;

    const cv::Mat& raster() const { return raster_; }
    const GridDims& grid() const { return grid_; }
    const CellSize& cell() const { return cell_; }

    uint64_t pixel_sum() const;

private:
    GridDims grid_;
    CellSize cell_;
    cv::Mat raster_;
};

} // namespace gvpreview::composite
