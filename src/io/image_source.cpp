#include "gvpreview/io/image_source.hpp"
#include "gvpreview/core/errors.hpp"
#include "gvpreview/core/utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdlib>
#include <system_error>
#include <vector>

namespace gvpreview::io {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        archive_read_close(a);
        archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        archive_write_close(a);
        archive_write_free(a);
    }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

fs::path safe_entry_path(const std::string& name) {
    fs::path p = fs::path(name).lexically_normal();
    bool escapes = p.is_absolute();
    for (const auto& part : p) {
        if (part == "..") {
            escapes = true;
            break;
        }
    }
    if (escapes) {
        return p.filename();
    }
    return p;
}

} // namespace

ScratchDirectory::ScratchDirectory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }

    std::string templ = (base / (prefix + "_XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw IOError("Cannot create scratch directory below " + base.string());
    }
    path_ = fs::path(buf.data());
}

ScratchDirectory::~ScratchDirectory() { cleanup(); }

void ScratchDirectory::cleanup() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        path_.clear();
    }
}

ExtractionResult extract_archive(const fs::path& archive_path, const fs::path& out_dir,
                                 const std::atomic<bool>* stop_flag) {
    ArchiveReader a(archive_read_new());
    if (!a) {
        throw ArchiveError("Failed to create archive reader");
    }
    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
        throw ArchiveError("Failed to open " + archive_path.string() + ": " +
                           archive_error_string(a.get()));
    }

    ArchiveWriter ext(archive_write_disk_new());
    if (!ext) {
        throw ArchiveError("Failed to create archive writer");
    }
    // Entries are rewritten to absolute paths below out_dir, so only the
    // ".." and symlink checks apply.
    archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME |
                                                  ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                  ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    ExtractionResult result;
    struct archive_entry* entry = nullptr;
    while (true) {
        if (stop_flag && stop_flag->load()) {
            throw StopRequested();
        }

        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw ArchiveError("Failed to read header in " + archive_path.string() + ": " +
                               archive_error_string(a.get()));
        }

        // Only regular files carry image data. Hard links report AE_IFREG too.
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) {
            continue;
        }
        const std::string name(raw_name);

        fs::path output_path = out_dir / safe_entry_path(name);
        std::error_code ec;
        fs::create_directories(output_path.parent_path(), ec);
        archive_entry_set_pathname(entry, output_path.string().c_str());

        if (const char* link = archive_entry_hardlink(entry)) {
            const fs::path link_path = out_dir / safe_entry_path(link);
            archive_entry_set_hardlink(entry, link_path.string().c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_WARN) {
            result.warnings.push_back("Cannot extract " + name + ": " +
                                      archive_error_string(ext.get()));
            if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                throw ArchiveError("Failed to skip " + name + " in " + archive_path.string() +
                                   ": " + archive_error_string(a.get()));
            }
            continue;
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        std::string entry_error;
        while ((r = archive_read_data_block(a.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_WARN) {
                entry_error = archive_error_string(ext.get());
                break;
            }
        }
        if (entry_error.empty() && r != ARCHIVE_EOF) {
            entry_error = archive_error_string(a.get());
        }
        if (entry_error.empty() && archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            entry_error = archive_error_string(ext.get());
        }

        if (!entry_error.empty()) {
            result.warnings.push_back("Cannot extract " + name + ": " + entry_error);
            fs::remove(output_path, ec);
            if (r == ARCHIVE_OK && archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                throw ArchiveError("Failed to skip " + name + " in " + archive_path.string() +
                                   ": " + archive_error_string(a.get()));
            }
            continue;
        }
        ++result.extracted;
    }

    return result;
}

ImageSource ImageSource::open(const fs::path& input, ImageFormat format,
                              const std::atomic<bool>* stop_flag) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw IOError("Input not found: " + input.string());
    }

    ImageSource source;
    source.input_ = input;

    if (fs::is_directory(input, ec)) {
        source.root_ = input;
    } else {
        source.scratch_ = std::make_unique<ScratchDirectory>("gvpreview_extract");
        source.root_ = source.scratch_->path();
        source.warnings_ = extract_archive(input, source.root_, stop_flag).warnings;
    }

    // Archives may nest their images in folders; a plain directory is only
    // listed at its top level so that sibling capture folders never mix.
    source.files_ = core::discover_files(source.root_, "*." + image_format_to_string(format),
                                         source.from_archive());
    return source;
}

std::string ImageSource::display_name(const fs::path& file) const {
    if (!scratch_) {
        return file.string();
    }
    return file.lexically_relative(root_).string();
}

} // namespace gvpreview::io
