#include "distpack/walker.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <set>
#include <string>

namespace fs = std::filesystem;

static void write_text(const fs::path &p, const std::string &s) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary);
  ofs << s;
}

static std::set<std::string> rel_paths(const std::vector<distpack::FileEntry> &entries) {
  std::set<std::string> out;
  for (const auto &e : entries)
    out.insert(e.relative_path);
  return out;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("distpack_walker_test_" + std::to_string(std::random_device{}()));

  try {
    write_text(root / "app" / "main.py", "print(1)\n");
    write_text(root / "app" / "sub" / "util.py", "x = 1\n");
    write_text(root / "templates" / "INDEX.HTML", "<p>hi</p>\n");
    write_text(root / "static" / "app.js", "var a;\n");
    write_text(root / "README.txt", "readme\n");
    write_text(root / "assets" / "skip.py", "# owned by the copy stage\n");
    fs::create_symlink(root / "app", root / "loop");

    // Extension filter; case of the file name does not matter
    distpack::WalkFilter py_html;
    py_html.extensions = {".py", ".html"};
    py_html.excluded = {root / "assets"};
    const distpack::TreeWalker walker{root, py_html};

    std::vector<distpack::WalkIssue> issues;
    const auto first = walker.collect(&issues);
    const std::set<std::string> expected{"app/main.py", "app/sub/util.py", "templates/INDEX.HTML"};
    if (rel_paths(first) != expected) {
      std::cerr << "filtered walk mismatch:";
      for (const auto &p : rel_paths(first))
        std::cerr << " " << p;
      std::cerr << "\n";
      return 1;
    }
    for (const auto &e : first) {
      if (e.relative_path == "templates/INDEX.HTML" && e.extension != ".html") {
        std::cerr << "extension not lowercased: " << e.extension << "\n";
        return 1;
      }
      if (!e.absolute_path.is_absolute() ||
          e.absolute_path.lexically_relative(fs::absolute(root)).generic_string() !=
              e.relative_path) {
        std::cerr << "entry not under root: " << e.absolute_path << "\n";
        return 1;
      }
    }

    // The symlink is recorded, not followed
    bool saw_link = false;
    for (const auto &w : issues)
      saw_link |= (w.kind == distpack::WalkIssueKind::Symlink && w.path.filename() == "loop");
    if (!saw_link) {
      std::cerr << "symlink not reported\n";
      return 1;
    }

    // Restartable: a fresh walk yields the same entries
    if (rel_paths(walker.collect()) != expected) {
      std::cerr << "second walk differs\n";
      return 1;
    }

    // Lazy walk via next()
    auto w = walker.walk();
    std::size_t n = 0;
    while (w.next())
      ++n;
    if (n != expected.size() || w.next()) {
      std::cerr << "next() produced " << n << " entries\n";
      return 1;
    }

    // No extension filter: every regular file
    const auto all = distpack::TreeWalker{root, distpack::WalkFilter{}}.collect();
    if (all.size() != 6) {
      std::cerr << "unfiltered walk found " << all.size() << " files\n";
      return 1;
    }

    // Missing root: recorded issue, no entries, no throw
    std::vector<distpack::WalkIssue> missing_issues;
    if (!distpack::TreeWalker{root / "nope", {}}.collect(&missing_issues).empty() ||
        missing_issues.empty()) {
      std::cerr << "missing root not reported\n";
      return 1;
    }

    // Unreadable subtree: reported, siblings still walked (skipped when running as root)
    const fs::path locked = root / "locked";
    write_text(locked / "hidden.py", "y = 2\n");
    fs::permissions(locked, fs::perms::none);
    std::error_code open_ec;
    fs::directory_iterator attempt(locked, open_ec);
    if (open_ec) {
      std::vector<distpack::WalkIssue> lock_issues;
      const auto got = rel_paths(walker.collect(&lock_issues));
      bool reported = false;
      for (const auto &wi : lock_issues)
        reported |= (wi.kind == distpack::WalkIssueKind::Unreadable && wi.path.filename() == "locked");
      if (!reported || got != expected) {
        std::cerr << "unreadable subtree handling wrong\n";
        return 1;
      }
    }
    fs::permissions(locked, fs::perms::owner_all);

    std::cout << "walker OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    fs::remove_all(root, ec);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
