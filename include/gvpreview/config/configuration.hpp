#pragma once

#include "gvpreview/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace gvpreview::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string path;           // directory or archive of sub-images
  std::string format = "jpg"; // jpg | jpeg | tif | tiff
};

struct OutputConfig {
  std::string path; // format follows the extension
};

struct LayoutConfig {
  std::string dims;              // ROWSxCOLS, in sub-images
  std::string resize = "200x300"; // ROWSxCOLS, pixels per sub-image
  std::string order = "colsright"; // colsright | colsleft | rowsdown | rowsup
  // Reject orders without a layout formula up front instead of skipping
  // every image at run time.
  bool strict_order = true;
};

struct LoggingConfig {
  bool verbose = false;
  std::string events_file; // JSON lines; empty = disabled
};

struct Config {
  InputConfig input;
  OutputConfig output;
  LayoutConfig layout;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Parsed views of the string settings. Throw ConfigError.
  GridDims grid_dims() const;
  CellSize cell_size() const;
  FillOrder fill_order() const;
  ImageFormat input_format() const;
};

} // namespace gvpreview::config
