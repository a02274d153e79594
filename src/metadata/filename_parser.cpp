#include "gvpreview/metadata/filename_parser.hpp"
#include "gvpreview/core/errors.hpp"

#include <limits>
#include <regex>
#include <stdexcept>

namespace gvpreview::metadata {

namespace {

const std::regex& filename_regex() {
    static const std::regex re(
        R"(^(\S+)_(\d{4}_\d{2}_\d{2}_\d{2}_\d{2}_\d{2}(?:_\d{2})+)_(\d+)\.(jpg|jpeg|tif|tiff)$)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

} // namespace

FilenameMetadata parse_filename(const fs::path& path) {
    const std::string name = path.filename().string();

    std::smatch m;
    if (!std::regex_match(name, m, filename_regex())) {
        throw ParseError(path.string() + " doesn't seem to be in the correct file naming format");
    }

    long long seq = 0;
    try {
        seq = std::stoll(m[3].str());
    } catch (const std::out_of_range&) {
        throw ParseError(path.string() + " has a sequence number that is too large");
    }
    if (seq < 1 || seq > std::numeric_limits<int>::max()) {
        throw ParseError(path.string() + " has sequence number " + m[3].str() +
                         ", expected a value starting at 1");
    }

    FilenameMetadata meta;
    meta.camera_name = m[1].str();
    meta.timestamp = m[2].str();
    meta.sequence_index = static_cast<int>(seq - 1);
    meta.extension = m[4].str();

    auto format = string_to_image_format(meta.extension);
    if (!format) {
        throw ParseError(path.string() + " has unsupported extension " + meta.extension);
    }
    meta.format = *format;
    return meta;
}

} // namespace gvpreview::metadata
