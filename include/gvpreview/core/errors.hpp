#pragma once

#include <stdexcept>
#include <string>

namespace gvpreview {

class GvPreviewError : public std::runtime_error {
public:
    explicit GvPreviewError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GvPreviewError {
public:
    explicit ConfigError(const std::string& message)
        : GvPreviewError("Config error: " + message) {}
};

class ValidationError : public ConfigError {
public:
    explicit ValidationError(const std::string& message)
        : ConfigError("Validation error: " + message) {}
};

// Filename does not follow the <camera>_<timestamp>_<seq>.<ext> convention.
class ParseError : public GvPreviewError {
public:
    explicit ParseError(const std::string& message)
        : GvPreviewError("Parse error: " + message) {}
};

class IndexOutOfRange : public GvPreviewError {
public:
    explicit IndexOutOfRange(const std::string& message)
        : GvPreviewError("Index out of range: " + message) {}
};

class UnsupportedOrder : public GvPreviewError {
public:
    explicit UnsupportedOrder(const std::string& message)
        : GvPreviewError("Unsupported fill order: " + message) {}
};

class DecodeError : public GvPreviewError {
public:
    explicit DecodeError(const std::string& message)
        : GvPreviewError("Decode error: " + message) {}
};

class ShapeMismatch : public GvPreviewError {
public:
    explicit ShapeMismatch(const std::string& message)
        : GvPreviewError("Shape mismatch: " + message) {}
};

class IOError : public GvPreviewError {
public:
    explicit IOError(const std::string& message)
        : GvPreviewError("I/O error: " + message) {}
};

class ArchiveError : public IOError {
public:
    explicit ArchiveError(const std::string& message)
        : IOError("Archive error: " + message) {}
};

class StopRequested : public GvPreviewError {
public:
    StopRequested() : GvPreviewError("Stop requested by user") {}
};

} // namespace gvpreview
