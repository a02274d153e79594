#include "gvpreview/image/resize.hpp"
#include "gvpreview/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace gvpreview::image {

namespace {

// Same sigma choice as scikit-image: (downscale factor - 1) / 2.
double antialias_sigma(int in_len, int out_len) {
    const double factor = static_cast<double>(in_len) / static_cast<double>(out_len);
    return std::max(0.0, (factor - 1.0) / 2.0);
}

cv::Mat gaussian_kernel(double sigma) {
    if (sigma <= 0.0) {
        return cv::getGaussianKernel(1, 1.0, CV_32F);
    }
    const int k = cvRound(sigma * 4.0 * 2.0 + 1.0) | 1;
    return cv::getGaussianKernel(k, sigma, CV_32F);
}

} // namespace

cv::Mat to_unit_float_bgr(const cv::Mat& image) {
    double scale = 1.0;
    switch (image.depth()) {
        case CV_8U: scale = 1.0 / 255.0; break;
        case CV_16U: scale = 1.0 / 65535.0; break;
        case CV_32F:
        case CV_64F: scale = 1.0; break;
        default:
            throw ShapeMismatch("unsupported sample depth " + std::to_string(image.depth()));
    }

    cv::Mat f;
    image.convertTo(f, CV_32F, scale);

    switch (f.channels()) {
        case 1: cv::cvtColor(f, f, cv::COLOR_GRAY2BGR); break;
        case 3: break;
        case 4: cv::cvtColor(f, f, cv::COLOR_BGRA2BGR); break;
        default:
            throw ShapeMismatch("unsupported channel count " + std::to_string(f.channels()));
    }
    return f;
}

cv::Mat downsize(const cv::Mat& image, const ResizeRequest& request) {
    if (request.size && request.scale) {
        throw ConfigError("Only one of size or scale can be given");
    }
    if (image.empty()) {
        throw ShapeMismatch("cannot resize an empty image");
    }

    int out_h = image.rows;
    int out_w = image.cols;
    if (request.size) {
        out_h = request.size->height;
        out_w = request.size->width;
        if (out_h <= 0 || out_w <= 0) {
            throw ConfigError("resize target must be positive, got " +
                              std::to_string(out_h) + "x" + std::to_string(out_w));
        }
    } else if (request.scale) {
        const double s = *request.scale;
        if (!(s > 0.0) || !std::isfinite(s)) {
            throw ConfigError("scale must be a positive number");
        }
        out_h = std::max(1, static_cast<int>(std::lround(image.rows * s)));
        out_w = std::max(1, static_cast<int>(std::lround(image.cols * s)));
    }

    cv::Mat work = to_unit_float_bgr(image);

    if (out_h != work.rows || out_w != work.cols) {
        const double sigma_y = antialias_sigma(work.rows, out_h);
        const double sigma_x = antialias_sigma(work.cols, out_w);
        if (sigma_x > 0.0 || sigma_y > 0.0) {
            cv::sepFilter2D(work, work, -1, gaussian_kernel(sigma_x), gaussian_kernel(sigma_y),
                            cv::Point(-1, -1), 0.0, cv::BORDER_REFLECT_101);
        }
        cv::resize(work, work, cv::Size(out_w, out_h), 0.0, 0.0, cv::INTER_CUBIC);
    }

    // Bicubic overshoots; clip back into range before quantizing.
    cv::min(work, 1.0, work);
    cv::max(work, 0.0, work);

    cv::Mat out;
    work.convertTo(out, CV_8U, 255.0);
    return out;
}

} // namespace gvpreview::image
