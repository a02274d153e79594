#pragma once

#include "gvpreview/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace gvpreview::io {

// Decode an image file into an 8-bit, 3-channel BGR raster.
// 16-bit samples are scaled down, grey images are expanded. Throws DecodeError.
cv::Mat read_image(const fs::path& path);

// Decode path into a SourceImage carrying the already parsed metadata.
SourceImage load_source_image(const fs::path& path, const FilenameMetadata& meta);

// Encode raster in the format implied by the extension of path. Throws IOError.
void write_image(const fs::path& path, const cv::Mat& raster);

// True when OpenCV has an encoder for the extension of path.
bool has_image_writer(const fs::path& path);

// Destination for the finished composite.
class RasterSink {
public:
    virtual ~RasterSink() = default;

    virtual void write(const cv::Mat& raster) = 0;
    virtual std::string describe() const = 0;
};

class FileRasterSink : public RasterSink {
public:
    explicit FileRasterSink(fs::path path);

    void write(const cv::Mat& raster) override;
    std::string describe() const override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace gvpreview::io
