#include "gvpreview/io/image_io.hpp"
#include "gvpreview/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <system_error>
#include <utility>

namespace gvpreview::io {

cv::Mat read_image(const fs::path& path) {
    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError("Cannot decode " + path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw DecodeError("Cannot decode " + path.string());
    }

    if (img.depth() == CV_16U) {
        img.convertTo(img, CV_8U, 1.0 / 257.0);
    } else if (img.depth() != CV_8U) {
        throw DecodeError("Unsupported sample depth in " + path.string());
    }

    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, img, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            break;
        case 4:
            cv::cvtColor(img, img, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw DecodeError("Unsupported channel count " + std::to_string(img.channels()) +
                              " in " + path.string());
    }
    return img;
}

SourceImage load_source_image(const fs::path& path, const FilenameMetadata& meta) {
    SourceImage image;
    image.filename = path.string();
    image.camera_name = meta.camera_name;
    image.timestamp = meta.timestamp;
    image.sequence_index = meta.sequence_index;
    image.extension = meta.extension;
    image.pixels = read_image(path);
    return image;
}

void write_image(const fs::path& path, const cv::Mat& raster) {
    if (raster.empty()) {
        throw IOError("Refusing to write an empty raster to " + path.string());
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory " + path.parent_path().string() + ": " +
                          ec.message());
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), raster);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + path.string());
    }
}

bool has_image_writer(const fs::path& path) {
    if (!path.has_extension()) {
        return false;
    }
    try {
        return cv::haveImageWriter(path.string());
    } catch (const cv::Exception&) {
        return false;
    }
}

FileRasterSink::FileRasterSink(fs::path path) : path_(std::move(path)) {}

void FileRasterSink::write(const cv::Mat& raster) {
    write_image(path_, raster);
}

std::string FileRasterSink::describe() const {
    return path_.string();
}

} // namespace gvpreview::io
