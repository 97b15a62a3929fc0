#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace distpack {

// Read `__version__ = "x.y.z"` from <package_root>/__init__.py, if present.
auto read_package_version(const std::filesystem::path &package_root) -> std::optional<std::string>;

} // namespace distpack
