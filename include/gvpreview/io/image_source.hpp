#pragma once

#include "gvpreview/core/types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace gvpreview::io {

// Temporary directory removed together with its contents on destruction.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix = "gvpreview");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return path_; }

    void cleanup();

private:
    fs::path path_;
};

struct ExtractionResult {
    size_t extracted = 0;
    std::vector<std::string> warnings; // one per entry that could not be written
};

// Extract every regular file of a (possibly compressed) tar archive below
// out_dir. Entry paths and hard link targets that are absolute or contain ".."
// are flattened to their file name. An entry that cannot be written is
// skipped with a warning. Throws ArchiveError when the archive itself cannot
// be opened or read, or StopRequested when stop_flag is raised between entries.
ExtractionResult extract_archive(const fs::path& archive_path, const fs::path& out_dir,
                                 const std::atomic<bool>* stop_flag = nullptr);

// Candidate input files for one run. The top level of a directory is listed
// directly, any other path is extracted into a scratch directory first and
// listed recursively; the scratch directory lives as long as the ImageSource.
class ImageSource {
public:
    static ImageSource open(const fs::path& input, ImageFormat format,
                            const std::atomic<bool>* stop_flag = nullptr);

    ImageSource(ImageSource&&) noexcept = default;
    ImageSource& operator=(ImageSource&&) noexcept = default;

    const std::vector<fs::path>& files() const { return files_; }
    const fs::path& input() const { return input_; }
    const fs::path& root() const { return root_; }
    bool from_archive() const { return scratch_ != nullptr; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    // Name of an item for diagnostics, relative to the extraction root for archives.
    std::string display_name(const fs::path& file) const;

private:
    ImageSource() = default;

    fs::path input_;
    fs::path root_;
    std::unique_ptr<ScratchDirectory> scratch_;
    std::vector<fs::path> files_;
    std::vector<std::string> warnings_;
};

} // namespace gvpreview::io
