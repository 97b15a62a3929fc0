#include "distpack/version.hpp"

#include "distpack/consts.hpp"
#include "distpack/fs.hpp"

#include <sstream>

namespace distpack {

std::optional<std::string> read_package_version(const std::filesystem::path &package_root) {
  const auto path = package_root / consts::kVersionFile;
  if (!fs::exists(path))
    return std::nullopt;

  const auto bytes = fs::read_file(path);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));
  std::string line;
  while (std::getline(iss, line)) {
    if (line.rfind(consts::kVersionKey, 0) != 0)
      continue;
    // __version__ = "1.2.3"  or  __version__ = '1.2.3'
    const char delim = line.find('"') != std::string::npos ? '"' : '\'';
    const auto open = line.find(delim);
    if (open == std::string::npos)
      continue;
    const auto close = line.find(delim, open + 1);
    if (close == std::string::npos)
      continue;
    return line.substr(open + 1, close - open - 1);
  }
  return std::nullopt;
}

} // namespace distpack
