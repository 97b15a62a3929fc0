#pragma once
#include "distpack/registry.hpp"
#include "distpack/transformer.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace distpack {

struct Config {
  std::filesystem::path source_dir;
  std::filesystem::path dist_dir;
  std::filesystem::path assets_dir;
  std::size_t jobs = 1;
  std::chrono::seconds tool_timeout{0};
  std::map<OperationKind, ToolCommand> tools;
};

auto default_config() -> Config;

// Read <project_root>/distpack.conf over the defaults (defaults only if the file is missing)
auto load_config(const std::filesystem::path &project_root) -> Config;

// Parse config text over the defaults. Throws std::runtime_error on bad values.
auto parse_config(std::string_view text) -> Config;

struct PackagePaths {
  std::filesystem::path source;
  std::filesystem::path dest;
};

// Resolve a package id against the config, relative to project_root.
// Empty id = the whole source_dir. Rejects absolute ids and ids containing "..".
auto package_paths(const Config &cfg, const std::filesystem::path &project_root,
                   const std::string &package) -> PackagePaths;

} // namespace distpack
