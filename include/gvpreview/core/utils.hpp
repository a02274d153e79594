#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace gvpreview::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
// Regular files below root whose name matches pattern, sorted by file name.
// Only the top level is listed unless recursive is set. Throws IOError.
std::vector<fs::path> discover_files(const fs::path& root, const std::string& pattern,
                                     bool recursive = false);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

// Glob pattern matching (case-insensitive)
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace gvpreview::core
