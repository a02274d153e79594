#pragma once

#include "gvpreview/core/types.hpp"

#include <string>

namespace gvpreview::metadata {

// Parse <camera>_<YYYY_MM_DD_HH_MM_SS>(_NN)+_<seq>.<ext> from the basename of
// path. The 1-based sequence number is returned zero-based. Throws ParseError.
FilenameMetadata parse_filename(const fs::path& path);

} // namespace gvpreview::metadata
