#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace distpack {

struct FileEntry {
  std::filesystem::path absolute_path;
  std::string relative_path; // generic ('/') form, relative to the walk root
  std::string extension;     // lowercased, with leading dot
};

enum class WalkIssueKind : std::uint8_t { Symlink, Unreadable };

// Non-fatal event met while enumerating. Unreadable issues cover a whole subtree.
struct WalkIssue {
  WalkIssueKind kind;
  std::filesystem::path path;
  std::string detail;
};

struct WalkFilter {
  std::set<std::string> extensions;              // empty = every regular file
  std::vector<std::filesystem::path> excluded;   // subtrees never entered
};

// Single pass over a tree. Entries are produced on demand; symlinks are not followed.
class TreeWalk {
public:
  TreeWalk(std::filesystem::path root, WalkFilter filter);

  // Next matching file, or nullopt when the walk is exhausted.
  auto next() -> std::optional<FileEntry>;

  [[nodiscard]] const std::vector<WalkIssue> &issues() const { return issues_; }

private:
  void open_dir(const std::filesystem::path &dir);
  [[nodiscard]] auto excluded(const std::filesystem::path &p) const -> bool;

  std::filesystem::path root_;
  WalkFilter filter_;
  std::vector<std::filesystem::directory_iterator> stack_;
  std::vector<WalkIssue> issues_;
};

// Restartable source of walks: every call to walk() starts over from the root.
class TreeWalker {
public:
  TreeWalker(std::filesystem::path root, WalkFilter filter);

  [[nodiscard]] auto walk() const -> TreeWalk;

  // Drain a fresh walk; issues are appended to `issues` when given.
  auto collect(std::vector<WalkIssue> *issues = nullptr) const -> std::vector<FileEntry>;

private:
  std::filesystem::path root_;
  WalkFilter filter_;
};

} // namespace distpack
