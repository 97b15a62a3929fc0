#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace distpack {

/**
 * Map a file under `source_root` to its counterpart under `dest_root`.
 *   map_path("/p/src", "/p/dist", "/p/src/app/main.py", ".pyc") -> "/p/dist/app/main.pyc"
 * Throws PathOutsideRootError unless `absolute_path` lies strictly below `source_root`.
 * Pure: touches no filesystem state.
 */
auto map_path(const std::filesystem::path &source_root, const std::filesystem::path &dest_root,
              const std::filesystem::path &absolute_path,
              const std::optional<std::string> &destination_extension = std::nullopt)
    -> std::filesystem::path;

} // namespace distpack
