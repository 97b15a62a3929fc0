#include "distpack/errors.hpp"
#include "distpack/stage.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

static void write_text(const fs::path &p, const std::string &s) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary);
  ofs << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Upper-cases the input; fails for any file whose name starts with "bad".
class FakeTransformer : public distpack::Transformer {
public:
  void apply(const fs::path &input, const fs::path &output) const override {
    ++calls;
    if (input.filename().string().rfind("bad", 0) == 0)
      throw distpack::TransformError("fake failure for " + input.filename().string());
    std::string s = slurp(input);
    for (auto &c : s)
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    std::ofstream ofs(output, std::ios::binary);
    ofs << s;
  }
  [[nodiscard]] std::string name() const override { return "fake"; }

  mutable std::atomic<int> calls{0};
};

static int run_compile_stage(const fs::path &src, const fs::path &dst, std::size_t jobs) {
  const auto reg = distpack::TransformRegistry::defaults();
  FakeTransformer fake;
  std::ostringstream log;
  distpack::StageRunner runner{reg, jobs, &log};

  const auto res = runner.run(distpack::OperationKind::Compile,
                              distpack::StageInput{.source_root = src, .dest_root = dst, .filter = {}},
                              fake);

  if (res.operation != distpack::OperationKind::Compile) {
    std::cerr << "wrong operation on result\n";
    return 1;
  }
  if (res.processed != 3 || res.failed.size() != 1 || fake.calls != 4) {
    std::cerr << "jobs=" << jobs << ": processed " << res.processed << ", failed "
              << res.failed.size() << ", calls " << fake.calls << "\n";
    return 1;
  }
  if (res.failed[0].entry.relative_path != "pkg/bad.py" ||
      res.failed[0].detail.find("fake failure") == std::string::npos) {
    std::cerr << "failure record wrong: " << res.failed[0].entry.relative_path << "\n";
    return 1;
  }
  if (slurp(dst / "a.pyc") != "A = 1\n" || slurp(dst / "pkg" / "deep" / "b.pyc") != "B = 2\n") {
    std::cerr << "compiled output wrong\n";
    return 1;
  }
  if (fs::exists(dst / "pkg" / "bad.pyc") || fs::exists(dst / "notes.txt") ||
      fs::exists(dst / "style.css")) {
    std::cerr << "stage wrote files it should not have\n";
    return 1;
  }
  if (log.str().find("FAIL pkg/bad.py") == std::string::npos) {
    std::cerr << "failure not logged: " << log.str() << "\n";
    return 1;
  }
  return 0;
}

// Runs the script stage over `src` with one external tool and expects a single recorded failure.
static int expect_tool_failure(const fs::path &src, const fs::path &dst,
                               distpack::ToolCommand command, std::chrono::seconds timeout,
                               const std::string &expected) {
  const auto reg = distpack::TransformRegistry::defaults();
  const distpack::ExternalToolTransformer tool{std::move(command), timeout};
  distpack::StageRunner runner{reg, 1};
  const auto res = runner.run(distpack::OperationKind::MinifyScript,
                              distpack::StageInput{.source_root = src, .dest_root = dst, .filter = {}},
                              tool);
  if (res.processed != 0 || res.failed.size() != 1) {
    std::cerr << "[" << expected << "] processed " << res.processed << ", failed "
              << res.failed.size() << "\n";
    return 1;
  }
  if (res.failed[0].entry.relative_path != "app.js" ||
      res.failed[0].detail.find(expected) == std::string::npos) {
    std::cerr << "expected [" << expected << "] in failure: " << res.failed[0].detail << "\n";
    return 1;
  }
  return 0;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("distpack_stage_test_" + std::to_string(std::random_device{}()));
  const fs::path src = base / "src";

  try {
    write_text(src / "a.py", "a = 1\n");
    write_text(src / "pkg" / "deep" / "b.py", "b = 2\n");
    write_text(src / "pkg" / "C.PY", "c = 3\n");
    write_text(src / "pkg" / "bad.py", "syntax error\n");
    write_text(src / "notes.txt", "not registered\n");
    write_text(src / "style.css", "a { }\n");

    // Sequential and pooled runs must agree
    if (run_compile_stage(src, base / "dist1", 1) != 0)
      return 1;
    if (run_compile_stage(src, base / "dist4", 4) != 0)
      return 1;

    // Case-insensitive match keeps the source name, swaps the extension
    if (!fs::exists(base / "dist4" / "pkg" / "C.pyc")) {
      std::cerr << "C.PY not compiled to C.pyc\n";
      return 1;
    }

    // Copy stage mirrors everything, registered or not
    const auto reg = distpack::TransformRegistry::defaults();
    distpack::CopyTransformer copy;
    distpack::StageRunner runner{reg, 2};
    const auto res = runner.run_copy(
        distpack::StageInput{.source_root = src, .dest_root = base / "mirror", .filter = {}}, copy);
    if (res.processed != 6 || !res.failed.empty()) {
      std::cerr << "copy stage processed " << res.processed << "\n";
      return 1;
    }
    if (slurp(base / "mirror" / "notes.txt") != "not registered\n") {
      std::cerr << "copy not byte-exact\n";
      return 1;
    }
    if (runner.directories().size() == 0) {
      std::cerr << "directory cache unused\n";
      return 1;
    }

    // Copy keeps the permission bits, also when it overwrites an older file
    write_text(base / "modes" / "run.sh", "#!/bin/sh\n");
    fs::permissions(base / "modes" / "run.sh", fs::perms(0755), fs::perm_options::replace);
    write_text(base / "modes_out" / "run.sh", "old\n");
    fs::permissions(base / "modes_out" / "run.sh", fs::perms(0644), fs::perm_options::replace);
    copy.apply(base / "modes" / "run.sh", base / "modes_out" / "run.sh");
    if (fs::status(base / "modes_out" / "run.sh").permissions() != fs::perms(0755) ||
        slurp(base / "modes_out" / "run.sh") != "#!/bin/sh\n") {
      std::cerr << "copy did not preserve mode 0755\n";
      return 1;
    }

    // External tool failures land on the file, not the stage
    using namespace std::chrono_literals;
    const fs::path tools = base / "tools";
    write_text(tools / "app.js", "var a = 1;\n");
    const distpack::ToolCommand noisy{"sh", "-c", "echo boom; exit 3", "{in}", "{out}"};
    const distpack::ToolCommand slow{"sh", "-c", "sleep 5", "{in}", "{out}"};
    const distpack::ToolCommand silent{"sh", "-c", "true", "{in}", "{out}"};
    if (expect_tool_failure(tools, base / "t_exit", noisy, 10s, "status 3") != 0 ||
        expect_tool_failure(tools, base / "t_exit", noisy, 10s, "boom") != 0 ||
        expect_tool_failure(tools, base / "t_slow", slow, 1s, "timed out") != 0 ||
        expect_tool_failure(tools, base / "t_silent", silent, 10s, "wrote no") != 0)
      return 1;

    // Output from an earlier build does not count as the tool's output
    write_text(base / "t_stale" / "app.js", "stale\n");
    if (expect_tool_failure(tools, base / "t_stale", silent, 10s, "wrote no") != 0)
      return 1;
    if (fs::exists(base / "t_stale" / "app.js")) {
      std::cerr << "stale output survived a failed tool run\n";
      return 1;
    }

    // Ensuring an existing directory twice is fine
    distpack::DirectoryCache dirs;
    dirs.ensure(base / "x" / "y");
    dirs.ensure(base / "x" / "y");
    if (dirs.size() != 1 || !fs::is_directory(base / "x" / "y")) {
      std::cerr << "directory cache not idempotent\n";
      return 1;
    }

    std::cout << "stage OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    fs::remove_all(base, ec);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
