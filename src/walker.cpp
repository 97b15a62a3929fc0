#include "distpack/walker.hpp"

#include "distpack/fs.hpp"

#include <utility>

namespace distpack {

TreeWalk::TreeWalk(std::filesystem::path root, WalkFilter filter)
    : root_(fs::normalize(root)), filter_(std::move(filter)) {
  for (auto &ex : filter_.excluded)
    ex = fs::normalize(ex);
  open_dir(root_);
}

void TreeWalk::open_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    issues_.push_back(
        WalkIssue{.kind = WalkIssueKind::Unreadable, .path = dir, .detail = ec.message()});
    return;
  }
  stack_.push_back(std::move(it));
}

bool TreeWalk::excluded(const std::filesystem::path &p) const {
  for (const auto &ex : filter_.excluded) {
    if (fs::is_within(p, ex))
      return true;
  }
  return false;
}

std::optional<FileEntry> TreeWalk::next() {
  while (!stack_.empty()) {
    auto &it = stack_.back();
    if (it == std::filesystem::directory_iterator()) {
      stack_.pop_back();
      continue;
    }

    const std::filesystem::directory_entry entry = *it;
    std::error_code ec;
    it.increment(ec);
    if (ec) {
      // The rest of this directory is lost; siblings higher up still get walked.
      issues_.push_back(WalkIssue{.kind = WalkIssueKind::Unreadable,
                                  .path = entry.path().parent_path(),
                                  .detail = ec.message()});
      stack_.pop_back();
    }

    const auto &p = entry.path();
    if (entry.is_symlink(ec)) {
      issues_.push_back(
          WalkIssue{.kind = WalkIssueKind::Symlink, .path = p, .detail = "symlink not followed"});
      continue;
    }
    if (excluded(p))
      continue;
    if (entry.is_directory(ec)) {
      open_dir(p); // may invalidate `it`; it is not touched again this round
      continue;
    }
    if (!entry.is_regular_file(ec))
      continue;

    std::string ext = fs::lower_extension(p);
    if (!filter_.extensions.empty() && !filter_.extensions.contains(ext))
      continue;

    return FileEntry{.absolute_path = p,
                     .relative_path = p.lexically_relative(root_).generic_string(),
                     .extension = std::move(ext)};
  }
  return std::nullopt;
}

TreeWalker::TreeWalker(std::filesystem::path root, WalkFilter filter)
    : root_(std::move(root)), filter_(std::move(filter)) {}

TreeWalk TreeWalker::walk() const { return TreeWalk{root_, filter_}; }

std::vector<FileEntry> TreeWalker::collect(std::vector<WalkIssue> *issues) const {
  auto w = walk();
  std::vector<FileEntry> out;
  while (auto e = w.next())
    out.push_back(std::move(*e));
  if (issues)
    issues->insert(issues->end(), w.issues().begin(), w.issues().end());
  return out;
}

} // namespace distpack
