#include "distpack/pipeline.hpp"

#include "distpack/fs.hpp"

#include <set>
#include <stdexcept>

namespace distpack {

namespace {

const char *stage_banner(OperationKind op) {
  switch (op) {
  case OperationKind::Compile:
    return "Compiling sources...";
  case OperationKind::MinifyMarkup:
    return "Minifying markup...";
  case OperationKind::MinifyScript:
    return "Minifying scripts...";
  case OperationKind::MinifyStyle:
    return "Minifying styles...";
  case OperationKind::Copy:
    return "Copying assets...";
  }
  return "";
}

void check_source_root(const std::filesystem::path &source) {
  std::error_code ec;
  if (!std::filesystem::is_directory(source, ec))
    throw std::runtime_error("source root is not a directory: " + source.string());
  std::filesystem::directory_iterator readable(source, ec);
  if (ec)
    throw std::runtime_error("source root unreadable: " + source.string() + ": " + ec.message());
}

void check_assets_subdir(const std::filesystem::path &sub) {
  if (sub.empty() || sub.is_absolute())
    throw std::runtime_error("assets directory must be relative: " + sub.string());
  for (const auto &part : sub) {
    if (part == "..")
      throw std::runtime_error("assets directory escapes the source root: " + sub.string());
  }
}

} // namespace

std::size_t BuildReport::processed() const {
  std::size_t n = 0;
  for (const auto &s : stages)
    n += s.processed;
  return n;
}

std::size_t BuildReport::failed() const {
  std::size_t n = 0;
  for (const auto &s : stages)
    n += s.failed.size();
  return n;
}

BuildReport build(const BuildOptions &options, const TransformRegistry &registry,
                  const TransformerSet &transformers) {
  const auto source = fs::normalize(options.source_root);
  const auto dest = fs::normalize(options.dest_root);

  check_source_root(source);
  check_assets_subdir(options.assets_subdir);
  if (fs::is_within(source, dest))
    throw std::runtime_error("destination " + dest.string() + " contains the source root " +
                             source.string());
  for (const OperationKind op : kStageOrder) {
    if (!transformers.get(op))
      throw std::runtime_error("no transformer for stage " + std::string(operation_name(op)));
  }

  std::error_code ec;
  std::filesystem::create_directories(dest, ec);
  if (ec)
    throw std::runtime_error("cannot create " + dest.string() + ": " + ec.message());

  const auto assets = (source / options.assets_subdir).lexically_normal();

  // The assets subtree belongs to the copy stage; an in-tree dist/ belongs to nobody.
  WalkFilter filter;
  filter.excluded.push_back(assets);
  if (fs::is_within(dest, source))
    filter.excluded.push_back(dest);

  StageRunner runner{registry, options.jobs, options.log};
  BuildReport report;

  for (const OperationKind op : kStageOrder) {
    if (options.log)
      *options.log << stage_banner(op) << "\n";

    if (op != OperationKind::Copy) {
      report.stages.push_back(runner.run(
          op, StageInput{.source_root = source, .dest_root = dest, .filter = filter},
          *transformers.get(op)));
      continue;
    }

    if (!std::filesystem::is_directory(assets, ec)) {
      if (options.log)
        *options.log << "  (no " << options.assets_subdir.generic_string() << " directory)\n";
      report.stages.push_back(StageResult{.operation = op});
      continue;
    }
    WalkFilter copy_filter;
    if (fs::is_within(dest, assets))
      copy_filter.excluded.push_back(dest);
    report.stages.push_back(runner.run_copy(
        StageInput{.source_root = assets,
                   .dest_root = dest / options.assets_subdir,
                   .filter = copy_filter},
        *transformers.get(op)));
  }
  return report;
}

void print_report(std::ostream &os, const BuildReport &report) {
  for (const auto &s : report.stages) {
    os << "stage " << operation_name(s.operation) << ": " << s.processed << " processed, "
       << s.failed.size() << " failed\n";
  }

  if (report.failed() > 0) {
    os << "\nfailed files:\n";
    for (const auto &s : report.stages) {
      for (const auto &f : s.failed)
        os << "  [" << operation_name(s.operation) << "] " << f.entry.relative_path << ": "
           << f.detail << "\n";
    }
  }

  // Every stage walks the same tree, so the same issue can show up once per stage.
  std::set<std::filesystem::path> seen;
  bool header = false;
  for (const auto &s : report.stages) {
    for (const auto &w : s.walk_issues) {
      if (!seen.insert(w.path).second)
        continue;
      if (!header) {
        os << "\nwalk issues:\n";
        header = true;
      }
      os << "  " << (w.kind == WalkIssueKind::Symlink ? "symlink   " : "unreadable") << " "
         << w.path.string() << ": " << w.detail << "\n";
    }
  }

  os << "\n"
     << report.processed() << " processed, " << report.failed() << " failed: "
     << (report.ok() ? "BUILD PASSED" : "BUILD FAILED") << "\n";
}

} // namespace distpack
