#pragma once

#include <opencv2/core.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gvpreview {

namespace fs = std::filesystem;

// Order in which sequence indices are laid out on the grid.
enum class FillOrder {
    COLS_RIGHT,  // column-major, columns left to right
    COLS_LEFT,   // column-major, columns right to left
    ROWS_DOWN,
    ROWS_UP
};

inline std::string fill_order_to_string(FillOrder order) {
    switch (order) {
        case FillOrder::COLS_RIGHT: return "colsright";
        case FillOrder::COLS_LEFT: return "colsleft";
        case FillOrder::ROWS_DOWN: return "rowsdown";
        case FillOrder::ROWS_UP: return "rowsup";
    }
    return "unknown";
}

// Image file formats accepted by the naming convention.
enum class ImageFormat {
    JPG,
    JPEG,
    TIF,
    TIFF
};

inline std::string image_format_to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPG: return "jpg";
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::TIF: return "tif";
        case ImageFormat::TIFF: return "tiff";
    }
    return "unknown";
}

inline std::optional<ImageFormat> string_to_image_format(const std::string& s) {
    std::string norm = s;
    if (!norm.empty() && norm.front() == '.') {
        norm.erase(norm.begin());
    }
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "jpg") return ImageFormat::JPG;
    if (norm == "jpeg") return ImageFormat::JPEG;
    if (norm == "tif") return ImageFormat::TIF;
    if (norm == "tiff") return ImageFormat::TIFF;
    return std::nullopt;
}

// Composite size in units of sub-images.
struct GridDims {
    int rows = 0;
    int cols = 0;

    long long capacity() const { return static_cast<long long>(rows) * cols; }
};

// Size of one sub-image in pixels.
struct CellSize {
    int height = 0;
    int width = 0;
};

struct GridPosition {
    int row = 0;
    int col = 0;

    bool operator==(const GridPosition& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const GridPosition& other) const { return !(*this == other); }
};

// Metadata encoded in a source file name.
struct FilenameMetadata {
    std::string camera_name;
    std::string timestamp;   // YYYY_MM_DD_HH_MM_SS[_NN...]
    int sequence_index = 0;  // zero-based
    std::string extension;   // as written in the file name
    ImageFormat format = ImageFormat::JPG;
};

// One decoded input image. pixels is always CV_8UC3.
struct SourceImage {
    std::string filename;
    std::string camera_name;
    std::string timestamp;
    int sequence_index = 0;
    std::string extension;
    cv::Mat pixels;
};

// Orchestrator states.
enum class Phase {
    INIT = 0,
    ENUMERATING = 1,
    COMPOSITING = 2,
    FINALIZING = 3,
    DONE = 4,
    ABORTED = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::INIT: return "INIT";
        case Phase::ENUMERATING: return "ENUMERATING";
        case Phase::COMPOSITING: return "COMPOSITING";
        case Phase::FINALIZING: return "FINALIZING";
        case Phase::DONE: return "DONE";
        case Phase::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace gvpreview
