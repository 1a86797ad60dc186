#pragma once

#include <stdexcept>
#include <string>

namespace npmerge {

// Error kinds raised by the merge library.
//
// All derive from std::runtime_error so CLI code can keep a single
// catch (const std::exception&) at the process boundary and only special-case
// the recoverable kinds.

// Unreadable/unwritable file, short read, failed rename.
// Any temporary output has already been removed when this propagates.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed sidecar line, missing required key, or unparsable value.
class MetadataParseError : public std::runtime_error {
public:
  explicit MetadataParseError(const std::string& what) : std::runtime_error(what) {}
};

// A probe number is embedded in more than one folder of the same source root.
class AmbiguousProbeError : public std::runtime_error {
public:
  explicit AmbiguousProbeError(const std::string& what) : std::runtime_error(what) {}
};

// The two roots hold a different number of files for one probe and strict
// matching was requested.
class FileCountMismatchError : public std::runtime_error {
public:
  explicit FileCountMismatchError(const std::string& what) : std::runtime_error(what) {}
};

// The two source roots share no probe number. Nothing was written.
//
// This is the one recoverable kind: callers may report it and carry on.
class NoMatchingProbesError : public std::runtime_error {
public:
  explicit NoMatchingProbesError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace npmerge
