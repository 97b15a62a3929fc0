#include "distpack/manifest.hpp"

#include "distpack/fs.hpp"
#include "distpack/hash.hpp"
#include "distpack/walker.hpp"

#include <stdexcept>

namespace distpack {

Manifest build_manifest(const std::filesystem::path &root) {
  std::vector<WalkIssue> issues;
  const auto entries = TreeWalker{root, WalkFilter{}}.collect(&issues);
  for (const auto &w : issues) {
    if (w.kind == WalkIssueKind::Unreadable)
      throw std::runtime_error("manifest: cannot read " + w.path.string() + ": " + w.detail);
  }

  Manifest m;
  for (const auto &e : entries)
    m[e.relative_path] = to_hex(sha256(fs::read_file(e.absolute_path)));
  return m;
}

} // namespace distpack
