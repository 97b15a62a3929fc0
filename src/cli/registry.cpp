#include "cli/registry.hpp"

#include "distpack/consts.hpp"

#include <algorithm>
#include <map>

namespace distpack::cli {

struct entry {
  command_fn fn;
  std::string synopsis;
  std::string summary;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &synopsis,
                      const std::string &summary) {
  table()[name] = entry{.fn = fn, .synopsis = synopsis, .summary = summary};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &os) {
  os << "usage: distpack <command> [package] [options]\n\n"
     << "Mirrors <source_dir>/<package> into <dist_dir>/<package>: Python is compiled, HTML,\n"
     << "JS and CSS are minified, and the assets subtree is copied verbatim. Settings come\n"
     << "from " << consts::kConfigFile << " in the working directory.\n\n"
     << "commands:\n";

  std::size_t width = 0;
  for (const auto &[name, e] : table())
    width = std::max(width, name.size() + 1 + e.synopsis.size());
  for (const auto &[name, e] : table()) {
    std::string head = name;
    if (!e.synopsis.empty())
      head += " " + e.synopsis;
    head.resize(width, ' ');
    os << "  " << head << "  " << e.summary << "\n";
  }
}

} // namespace distpack::cli
