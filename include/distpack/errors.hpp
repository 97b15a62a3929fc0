#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace distpack {

// A path handed to the mapper does not lie under the source root.
class PathOutsideRootError : public std::runtime_error {
public:
  PathOutsideRootError(const std::filesystem::path &path, const std::filesystem::path &root)
      : std::runtime_error("path outside root: " + path.string() + " (root " + root.string() + ")"),
        path_(path) {}

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// One file could not be transformed. Recorded by the stage, never fatal.
class TransformError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Cleanup was pointed at something it must never delete.
class UnsafeTargetError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace distpack
