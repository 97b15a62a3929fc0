#pragma once
#include <cstddef>
#include <filesystem>

namespace distpack {

// Write `root` as a gzip-compressed ustar archive. Entry order and headers are fixed
// (sorted paths, zero mtime/uid/gid), so the same tree always yields the same bytes.
// `out` must lie outside `root`. Returns the number of file entries written.
auto write_tar_gz(const std::filesystem::path &root, const std::filesystem::path &out)
    -> std::size_t;

} // namespace distpack
