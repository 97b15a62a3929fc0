#include "distpack/fs.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace distpack::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

void copy_file_with_mode(const std::filesystem::path &from, const std::filesystem::path &to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec)
    throw std::runtime_error("copy failed: " + from.string() + " -> " + to.string() + ": " +
                             ec.message());
  // copy_file already carries the mode on POSIX; this covers an overwritten target.
  const auto st = std::filesystem::status(from, ec);
  if (!ec)
    std::filesystem::permissions(to, st.permissions(), ec);
}

std::filesystem::path normalize(const std::filesystem::path &p) {
  auto out = std::filesystem::absolute(p).lexically_normal();
  if (out.has_relative_path() && out.filename().empty())
    out = out.parent_path();
  return out;
}

bool is_within(const std::filesystem::path &p, const std::filesystem::path &root) {
  const auto np = normalize(p);
  const auto nr = normalize(root);
  auto pi = np.begin();
  for (auto ri = nr.begin(); ri != nr.end(); ++ri, ++pi) {
    if (pi == np.end() || *pi != *ri)
      return false;
  }
  return true;
}

std::string lower_extension(const std::filesystem::path &p) {
  std::string ext = p.extension().string();
  std::ranges::transform(ext, ext.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace distpack::fs
