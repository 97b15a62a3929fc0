#include "distpack/stage.hpp"

#include "distpack/fs.hpp"
#include "distpack/path_map.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace distpack {

void DirectoryCache::ensure(const std::filesystem::path &dir) {
  std::lock_guard<std::mutex> lock(mu_);
  if (ensured_.contains(dir))
    return;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec && !std::filesystem::is_directory(dir))
    throw std::runtime_error("mkdir -p failed: " + dir.string() + ": " + ec.message());
  ensured_.insert(dir);
}

std::size_t DirectoryCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ensured_.size();
}

StageRunner::StageRunner(const TransformRegistry &registry, std::size_t jobs, std::ostream *log)
    : registry_(registry), jobs_(std::max<std::size_t>(jobs, 1)), log_(log) {}

StageResult StageRunner::run(OperationKind op, const StageInput &in,
                             const Transformer &transformer) {
  const auto exts = registry_.extensions_for(op);
  if (exts.empty())
    return StageResult{.operation = op};

  WalkFilter filter = in.filter;
  filter.extensions = std::set<std::string>(exts.begin(), exts.end());

  const auto source_root = fs::normalize(in.source_root);
  const auto dest_root = fs::normalize(in.dest_root);

  std::vector<WalkIssue> issues;
  const auto entries = TreeWalker{source_root, filter}.collect(&issues);

  std::vector<Job> jobs;
  jobs.reserve(entries.size());
  for (const auto &entry : entries) {
    const auto spec = registry_.resolve(entry.extension);
    if (!spec || spec->operation != op)
      continue; // not stage-eligible
    auto dest = map_path(source_root, dest_root, entry.absolute_path, spec->destination_extension);
    jobs.push_back(Job{.entry = entry, .destination = std::move(dest)});
  }

  auto res = execute(op, std::move(jobs), transformer);
  res.walk_issues = std::move(issues);
  return res;
}

StageResult StageRunner::run_copy(const StageInput &in, const Transformer &transformer) {
  WalkFilter filter = in.filter;
  filter.extensions.clear();

  const auto source_root = fs::normalize(in.source_root);
  const auto dest_root = fs::normalize(in.dest_root);

  std::vector<WalkIssue> issues;
  const auto entries = TreeWalker{source_root, filter}.collect(&issues);

  std::vector<Job> jobs;
  jobs.reserve(entries.size());
  for (const auto &entry : entries)
    jobs.push_back(
        Job{.entry = entry, .destination = map_path(source_root, dest_root, entry.absolute_path)});

  auto res = execute(OperationKind::Copy, std::move(jobs), transformer);
  res.walk_issues = std::move(issues);
  return res;
}

StageResult StageRunner::execute(OperationKind op, std::vector<Job> jobs,
                                 const Transformer &transformer) {
  // Walk order is unspecified; sort so reports and logs are reproducible.
  std::ranges::sort(jobs, [](const Job &a, const Job &b) {
    return a.entry.relative_path < b.entry.relative_path;
  });

  std::vector<std::optional<std::string>> errors(jobs.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= jobs.size())
        return;
      const auto &job = jobs[i];
      try {
        dirs_.ensure(job.destination.parent_path());
        transformer.apply(job.entry.absolute_path, job.destination);
      } catch (const std::exception &e) {
        errors[i] = e.what();
      }
    }
  };

  const std::size_t n_threads = std::min(jobs_, jobs.size());
  if (n_threads <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (std::size_t t = 0; t < n_threads; ++t)
      pool.emplace_back(worker);
    for (auto &th : pool)
      th.join();
  }

  StageResult res{.operation = op};
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    if (errors[i]) {
      if (log_)
        *log_ << "  FAIL " << jobs[i].entry.relative_path << ": " << *errors[i] << "\n";
      res.failed.push_back(StageFailure{.entry = jobs[i].entry, .detail = *errors[i]});
    } else {
      if (log_)
        *log_ << "  ok   " << jobs[i].entry.relative_path << "\n";
      ++res.processed;
    }
  }
  return res;
}

} // namespace distpack
