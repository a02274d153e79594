#include "test_helpers.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <iterator>

namespace gvpreview::testing {

void write_solid_image(const fs::path& path, int height, int width, const cv::Scalar& bgr) {
    cv::Mat img(height, width, CV_8UC3, bgr);
    fs::create_directories(path.parent_path());
    if (!cv::imwrite(path.string(), img)) {
        throw std::runtime_error("cannot write test image " + path.string());
    }
}

void write_garbage(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << "this is not an image";
}

void write_tar(const fs::path& tar_path, const std::vector<TarEntry>& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        std::string msg = archive_error_string(a);
        archive_write_free(a);
        throw std::runtime_error("cannot create tar: " + msg);
    }

    for (const auto& e : entries) {
        std::string data;
        if (e.hardlink.empty()) {
            std::ifstream in(e.source, std::ios::binary);
            data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.name.c_str());
        if (!e.hardlink.empty()) {
            archive_entry_set_hardlink(entry, e.hardlink.c_str());
        }
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_write_header(a, entry);
        if (!data.empty()) {
            archive_write_data(a, data.data(), data.size());
        }
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
}

std::string camera_filename(int sequence_number, const std::string& ext,
                            const std::string& camera) {
    return camera + "_2018_10_25_11_30_00_01_" + std::to_string(sequence_number) + "." + ext;
}

} // namespace gvpreview::testing
