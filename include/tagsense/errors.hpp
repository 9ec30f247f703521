#pragma once

#include <stdexcept>
#include <string>

namespace tagsense {

// Base for every failure the estimator reports by exception.
// Numeric degeneracies and out-of-range temperatures are not errors:
// the first are recovered in place, the second are flagged per tag.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Input frame does not match the (slots, 2, R, W) contract
class ShapeError : public Error {
public:
    explicit ShapeError(const std::string& what) : Error(what) {}
};

// Inference called before a parameter snapshot was loaded
class NotLoadedError : public Error {
public:
    explicit NotLoadedError(const std::string& what) : Error(what) {}
};

// Snapshot file does not exist
class MissingSnapshotError : public Error {
public:
    explicit MissingSnapshotError(const std::string& what) : Error(what) {}
};

// Snapshot file exists but cannot be parsed
class SnapshotFormatError : public Error {
public:
    explicit SnapshotFormatError(const std::string& what) : Error(what) {}
};

// Snapshot tensors do not match the configured architecture
class ArchitectureMismatchError : public SnapshotFormatError {
public:
    explicit ArchitectureMismatchError(const std::string& what) : SnapshotFormatError(what) {}
};

// Stream ended in the middle of a frame
class FrameReadError : public Error {
public:
    explicit FrameReadError(const std::string& what) : Error(what) {}
};

// Invalid configuration value
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace tagsense
