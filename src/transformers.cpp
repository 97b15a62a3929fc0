#include "distpack/transformer.hpp"

#include "distpack/consts.hpp"
#include "distpack/errors.hpp"
#include "distpack/fs.hpp"
#include "distpack/process.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace distpack {

void CopyTransformer::apply(const std::filesystem::path &input,
                            const std::filesystem::path &output) const {
  try {
    fs::copy_file_with_mode(input, output);
  } catch (const std::exception &e) {
    throw TransformError(e.what());
  }
}

ExternalToolTransformer::ExternalToolTransformer(ToolCommand command,
                                                 std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {
  validate_tool(command_);
}

std::string ExternalToolTransformer::name() const { return command_.front(); }

std::vector<std::string>
ExternalToolTransformer::argv_for(const std::filesystem::path &input,
                                  const std::filesystem::path &output) const {
  std::vector<std::string> argv;
  argv.reserve(command_.size());
  for (const auto &arg : command_) {
    if (arg == consts::kInPlaceholder)
      argv.push_back(input.string());
    else if (arg == consts::kOutPlaceholder)
      argv.push_back(output.string());
    else
      argv.push_back(arg);
  }
  return argv;
}

void ExternalToolTransformer::apply(const std::filesystem::path &input,
                                    const std::filesystem::path &output) const {
  // Output left by an earlier build must not pass for this run's result.
  std::error_code ec;
  std::filesystem::remove(output, ec);
  if (ec)
    throw TransformError("cannot replace " + output.string() + ": " + ec.message());

  const auto res = run_process(argv_for(input, output), timeout_);
  if (!res.spawned)
    throw TransformError("cannot run " + name() + ": " + res.error);
  if (res.timed_out)
    throw TransformError(name() + " timed out after " + std::to_string(timeout_.count()) + "s");
  if (res.exit_code != 0) {
    std::string msg = name() + " exited with status " + std::to_string(res.exit_code);
    if (!res.output.empty())
      msg += ": " + res.output;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
      msg.pop_back();
    throw TransformError(msg);
  }
  if (!fs::exists(output))
    throw TransformError(name() + " exited 0 but wrote no " + output.string());
}

ToolCommand default_tool(OperationKind op) {
  switch (op) {
  case OperationKind::Compile:
    return {"python3", "-c",
            "import py_compile,sys; py_compile.compile(sys.argv[1], cfile=sys.argv[2], "
            "doraise=True)",
            "{in}", "{out}"};
  case OperationKind::MinifyMarkup:
    return {"html-minifier",
            "--collapse-whitespace",
            "--remove-comments",
            "--remove-script-type-attributes",
            "--remove-style-link-type-attributes",
            "--minify-css",
            "true",
            "--minify-js",
            "true",
            "{in}",
            "-o",
            "{out}"};
  case OperationKind::MinifyScript:
    return {"uglifyjs", "{in}", "-o", "{out}"};
  case OperationKind::MinifyStyle:
    return {"cleancss", "-o", "{out}", "{in}"};
  case OperationKind::Copy:
    break;
  }
  return {};
}

void validate_tool(const ToolCommand &cmd) {
  if (cmd.empty())
    throw std::runtime_error("tool command is empty");
  const bool has_in = std::find(cmd.begin(), cmd.end(), consts::kInPlaceholder) != cmd.end();
  const bool has_out = std::find(cmd.begin(), cmd.end(), consts::kOutPlaceholder) != cmd.end();
  if (!has_in || !has_out)
    throw std::runtime_error("tool command for " + cmd.front() + " needs both {in} and {out}");
}

void TransformerSet::set(OperationKind op, std::shared_ptr<const Transformer> t) {
  table_[op] = std::move(t);
}

const Transformer *TransformerSet::get(OperationKind op) const {
  const auto it = table_.find(op);
  return it == table_.end() ? nullptr : it->second.get();
}

TransformerSet TransformerSet::from_tools(const std::map<OperationKind, ToolCommand> &tools,
                                          std::chrono::seconds timeout) {
  TransformerSet set;
  for (const OperationKind op : kStageOrder) {
    if (op == OperationKind::Copy) {
      set.set(op, std::make_shared<CopyTransformer>());
      continue;
    }
    const auto it = tools.find(op);
    ToolCommand cmd = it != tools.end() ? it->second : default_tool(op);
    set.set(op, std::make_shared<ExternalToolTransformer>(std::move(cmd), timeout));
  }
  return set;
}

} // namespace distpack
