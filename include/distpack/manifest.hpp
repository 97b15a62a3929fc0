#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace distpack {

using Manifest = std::map<std::string, std::string>; // relative path -> 64-hex sha256

// Fingerprint every regular file under root (symlinks are skipped).
auto build_manifest(const std::filesystem::path &root) -> Manifest;

} // namespace distpack
