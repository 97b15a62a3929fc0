#include "distpack/config.hpp"

#include "distpack/consts.hpp"
#include "distpack/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

long parse_number(std::string_view key, const std::string &value) {
  long n = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, n);
  if (ec != std::errc() || ptr != last)
    throw std::runtime_error("config: " + std::string(key) + ": not a number: " + value);
  return n;
}

// Whitespace-separated words; "double quotes" keep spaces inside one word.
distpack::ToolCommand split_command(const std::string &value) {
  distpack::ToolCommand out;
  std::string cur;
  bool quoted = false;
  bool in_word = false;
  for (char c : value) {
    if (c == '"') {
      quoted = !quoted;
      in_word = true;
    } else if (!quoted && (c == ' ' || c == '\t')) {
      if (in_word)
        out.push_back(std::move(cur));
      cur.clear();
      in_word = false;
    } else {
      cur.push_back(c);
      in_word = true;
    }
  }
  if (quoted)
    throw std::runtime_error("config: unterminated quote in: " + value);
  if (in_word)
    out.push_back(std::move(cur));
  return out;
}

} // namespace

namespace distpack {

Config default_config() {
  Config cfg{};
  cfg.source_dir = consts::kDefaultSource;
  cfg.dist_dir = consts::kDefaultDist;
  cfg.assets_dir = consts::kDefaultAssets;
  cfg.jobs = std::max(1U, std::thread::hardware_concurrency());
  cfg.tool_timeout = std::chrono::seconds(consts::kDefaultToolTimeout);
  for (const OperationKind op : kStageOrder) {
    if (op != OperationKind::Copy)
      cfg.tools[op] = default_tool(op);
  }
  return cfg;
}

auto parse_config(std::string_view text) -> Config {
  Config cfg = default_config();
  std::istringstream iss{std::string(text)};

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    const std::string stripped = trim(sv);
    if (stripped.empty() || stripped[0] == '#')
      continue; // allow comments
    const auto colon = stripped.find(':');
    if (colon == std::string::npos)
      throw std::runtime_error("config: expected `key: value`: " + stripped);
    const std::string key = trim(std::string_view(stripped).substr(0, colon));
    const std::string value = trim(std::string_view(stripped).substr(colon + 1));

    if (key == "source_dir") {
      cfg.source_dir = value;
    } else if (key == "dist_dir") {
      cfg.dist_dir = value;
    } else if (key == "assets_dir") {
      cfg.assets_dir = value;
    } else if (key == "jobs") {
      const long n = parse_number(key, value);
      if (n < 1)
        throw std::runtime_error("config: jobs must be at least 1");
      cfg.jobs = static_cast<std::size_t>(n);
    } else if (key == "tool_timeout") {
      const long n = parse_number(key, value);
      if (n < 0)
        throw std::runtime_error("config: tool_timeout must not be negative");
      if (n > consts::kMaxToolTimeout)
        throw std::runtime_error("config: tool_timeout must be at most " +
                                 std::to_string(consts::kMaxToolTimeout) + " seconds");
      cfg.tool_timeout = std::chrono::seconds(n);
    } else if (key == "tool.compile") {
      cfg.tools[OperationKind::Compile] = split_command(value);
    } else if (key == "tool.markup") {
      cfg.tools[OperationKind::MinifyMarkup] = split_command(value);
    } else if (key == "tool.script") {
      cfg.tools[OperationKind::MinifyScript] = split_command(value);
    } else if (key == "tool.style") {
      cfg.tools[OperationKind::MinifyStyle] = split_command(value);
    }
  }

  for (const auto &[op, cmd] : cfg.tools)
    validate_tool(cmd);
  return cfg;
}

auto load_config(const std::filesystem::path &project_root) -> Config {
  const auto path = project_root / consts::kConfigFile;
  if (!fs::exists(path))
    return default_config();

  const auto bytes = fs::read_file(path);
  return parse_config(std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

auto package_paths(const Config &cfg, const std::filesystem::path &project_root,
                   const std::string &package) -> PackagePaths {
  const std::filesystem::path pkg{package};
  if (pkg.is_absolute())
    throw std::runtime_error("package must be a name, not an absolute path: " + package);
  for (const auto &part : pkg) {
    if (part == "..")
      throw std::runtime_error("package must not contain '..': " + package);
  }
  return PackagePaths{.source = fs::normalize(project_root / cfg.source_dir / pkg),
                      .dest = fs::normalize(project_root / cfg.dist_dir / pkg)};
}

} // namespace distpack
