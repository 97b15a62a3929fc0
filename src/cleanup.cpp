#include "distpack/cleanup.hpp"

#include "distpack/errors.hpp"
#include "distpack/fs.hpp"

#include <stdexcept>

namespace distpack {

namespace {

// Follows symlinks so that a link pointing back at the sources is caught too.
std::filesystem::path resolve(const std::filesystem::path &p) {
  std::error_code ec;
  auto out = std::filesystem::weakly_canonical(std::filesystem::absolute(p), ec);
  if (ec)
    return fs::normalize(p);
  return fs::normalize(out);
}

} // namespace

void clean(const std::filesystem::path &dest_root, const std::filesystem::path &source_root) {
  if (dest_root.empty())
    throw UnsafeTargetError("refusing to clean an empty path");

  const auto dest = resolve(dest_root);
  const auto source = resolve(source_root);

  if (!dest.has_relative_path())
    throw UnsafeTargetError("refusing to clean the filesystem root: " + dest_root.string());
  if (fs::is_within(source, dest))
    throw UnsafeTargetError("refusing to clean " + dest.string() + ": it contains the sources at " +
                            source.string());

  // The checks above ran on the resolved path; deletion acts on the path as given, so a
  // symlinked destination loses only the link, never the directory it points at.
  const auto target = fs::normalize(dest_root);
  std::error_code ec;
  const auto st = std::filesystem::symlink_status(target, ec);
  if (!std::filesystem::exists(st))
    return;
  if (std::filesystem::is_symlink(st))
    std::filesystem::remove(target, ec);
  else
    std::filesystem::remove_all(target, ec);
  if (ec)
    throw std::runtime_error("remove " + target.string() + " failed: " + ec.message());
}

} // namespace distpack
