#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace distpack::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Byte-exact copy of a regular file; carries the permission bits over when it can.
void copy_file_with_mode(const std::filesystem::path& from, const std::filesystem::path& to);

// Lexically normalized absolute path with no trailing separator.
std::filesystem::path normalize(const std::filesystem::path& p);

// True when `p` is `root` itself or lies anywhere below it (lexical check).
bool is_within(const std::filesystem::path& p, const std::filesystem::path& root);

// Lowercased final extension including the dot ("" when there is none).
std::string lower_extension(const std::filesystem::path& p);

} // namespace distpack::fs
