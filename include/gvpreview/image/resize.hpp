#pragma once

#include "gvpreview/core/types.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace gvpreview::image {

// Either an absolute output size or a relative scale factor, never both.
struct ResizeRequest {
    std::optional<CellSize> size;
    std::optional<double> scale;
};

// Anti-aliased bicubic resize. Accepts 8/16-bit or float input with 1, 3 or 4
// channels and always returns CV_8UC3. With an empty request the image is
// only converted. Throws ConfigError for conflicting or non-positive requests.
cv::Mat downsize(const cv::Mat& image, const ResizeRequest& request);

inline cv::Mat downsize(const cv::Mat& image, const CellSize& size) {
    return downsize(image, ResizeRequest{size, std::nullopt});
}

// Convert to CV_32FC3 with samples in [0, 1].
cv::Mat to_unit_float_bgr(const cv::Mat& image);

} // namespace gvpreview::image
