#pragma once
#include <filesystem>

namespace distpack {

// Recursively delete `dest_root`. Throws UnsafeTargetError, before deleting anything, when
// dest_root is empty, is the filesystem root, or is `source_root` or one of its ancestors.
// A missing dest_root is not an error.
void clean(const std::filesystem::path &dest_root, const std::filesystem::path &source_root);

} // namespace distpack
