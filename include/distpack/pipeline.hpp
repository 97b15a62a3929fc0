#pragma once
#include "distpack/registry.hpp"
#include "distpack/stage.hpp"
#include "distpack/transformer.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <vector>

namespace distpack {

struct BuildOptions {
  std::filesystem::path source_root;
  std::filesystem::path dest_root;
  std::filesystem::path assets_subdir = "assets"; // relative to source_root
  std::size_t jobs = 1;
  std::ostream *log = nullptr;
};

struct BuildReport {
  std::vector<StageResult> stages; // in execution order

  [[nodiscard]] auto processed() const -> std::size_t;
  [[nodiscard]] auto failed() const -> std::size_t;
  [[nodiscard]] auto ok() const -> bool { return failed() == 0; }
  [[nodiscard]] auto exit_code() const -> int { return ok() ? 0 : 1; }
};

/**
 * Run Compile, MinifyMarkup, MinifyScript, MinifyStyle, then copy-assets.
 * Per-file failures are collected in the report and never stop later stages.
 * Throws std::runtime_error if the source root is missing or unreadable, or a
 * transformer is missing for a stage.
 */
auto build(const BuildOptions &options, const TransformRegistry &registry,
           const TransformerSet &transformers) -> BuildReport;

// Summary: every failure with its cause, walk issues, totals and PASS/FAIL.
void print_report(std::ostream &os, const BuildReport &report);

} // namespace distpack
