#pragma once
#include "distpack/registry.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace distpack {

// Produce `output` from `input`. Throws TransformError on failure.
class Transformer {
public:
  virtual ~Transformer() = default;
  virtual void apply(const std::filesystem::path &input,
                     const std::filesystem::path &output) const = 0;
  [[nodiscard]] virtual auto name() const -> std::string = 0;
};

// In-process byte-exact copy.
class CopyTransformer : public Transformer {
public:
  void apply(const std::filesystem::path &input,
             const std::filesystem::path &output) const override;
  [[nodiscard]] auto name() const -> std::string override { return "copy"; }
};

// argv template such as {"uglifyjs", "{in}", "-o", "{out}"}
using ToolCommand = std::vector<std::string>;

// Shells out to an external tool found on PATH.
class ExternalToolTransformer : public Transformer {
public:
  ExternalToolTransformer(ToolCommand command, std::chrono::seconds timeout);

  void apply(const std::filesystem::path &input,
             const std::filesystem::path &output) const override;
  [[nodiscard]] auto name() const -> std::string override;

  [[nodiscard]] auto argv_for(const std::filesystem::path &input,
                              const std::filesystem::path &output) const
      -> std::vector<std::string>;

private:
  ToolCommand command_;
  std::chrono::seconds timeout_;
};

auto default_tool(OperationKind op) -> ToolCommand;

// Throws std::runtime_error if `cmd` is empty or lacks {in} / {out}.
void validate_tool(const ToolCommand &cmd);

// One transformer per operation. The build refuses to run a stage with no transformer.
class TransformerSet {
public:
  void set(OperationKind op, std::shared_ptr<const Transformer> t);
  [[nodiscard]] auto get(OperationKind op) const -> const Transformer *;

  // External tools from `tools` (falling back to default_tool) plus the in-process copy.
  static auto from_tools(const std::map<OperationKind, ToolCommand> &tools,
                         std::chrono::seconds timeout) -> TransformerSet;

private:
  std::map<OperationKind, std::shared_ptr<const Transformer>> table_;
};

} // namespace distpack
