#pragma once
#include "distpack/registry.hpp"
#include "distpack/transformer.hpp"
#include "distpack/walker.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace distpack {

struct StageFailure {
  FileEntry entry;
  std::string detail;
};

struct StageResult {
  OperationKind operation;
  std::size_t processed = 0;          // files transformed successfully
  std::vector<StageFailure> failed;   // ordered by relative path
  std::vector<WalkIssue> walk_issues;
};

// Directories created so far by one runner. Creating an existing directory is not an error.
class DirectoryCache {
public:
  void ensure(const std::filesystem::path &dir);
  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::set<std::filesystem::path> ensured_;
};

struct StageInput {
  std::filesystem::path source_root;
  std::filesystem::path dest_root;
  WalkFilter filter;
};

class StageRunner {
public:
  StageRunner(const TransformRegistry &registry, std::size_t jobs, std::ostream *log = nullptr);

  // Transform every registered file under source_root whose operation is `op`.
  auto run(OperationKind op, const StageInput &in, const Transformer &transformer) -> StageResult;

  // Mirror every file under source_root verbatim (no extension filter, no registry lookup).
  auto run_copy(const StageInput &in, const Transformer &transformer) -> StageResult;

  [[nodiscard]] const DirectoryCache &directories() const { return dirs_; }

private:
  struct Job {
    FileEntry entry;
    std::filesystem::path destination;
  };

  auto execute(OperationKind op, std::vector<Job> jobs, const Transformer &transformer)
      -> StageResult;

  const TransformRegistry &registry_;
  std::size_t jobs_;
  std::ostream *log_;
  DirectoryCache dirs_;
};

} // namespace distpack
