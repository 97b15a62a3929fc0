#include "distpack/archive.hpp"

#include "distpack/consts.hpp"
#include "distpack/fs.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

namespace distpack {

namespace {

using Block = std::array<char, consts::kTarBlock>;

struct TarItem {
  std::string name; // relative, '/'-separated; directories end in '/'
  std::filesystem::path path;
  bool is_dir;
};

// Closes the gz stream on every exit path; close() reports the final flush.
class GzWriter {
public:
  explicit GzWriter(const std::filesystem::path &out) : out_(out) {
    file_ = gzopen(out.string().c_str(), "wb9");
    if (!file_)
      throw std::runtime_error("gzopen failed: " + out.string());
  }
  ~GzWriter() {
    if (file_)
      gzclose(file_);
  }
  GzWriter(const GzWriter &) = delete;
  GzWriter &operator=(const GzWriter &) = delete;

  void write(const char *data, std::size_t n) {
    if (n == 0)
      return;
    const int w = gzwrite(file_, data, static_cast<unsigned>(n));
    if (w <= 0 || static_cast<std::size_t>(w) != n)
      throw std::runtime_error("gzwrite failed: " + out_.string());
  }

  void close() {
    const int rc = gzclose(file_);
    file_ = nullptr;
    if (rc != Z_OK)
      throw std::runtime_error("gzclose failed: " + out_.string());
  }

private:
  std::filesystem::path out_;
  gzFile file_ = nullptr;
};

void put_octal(char *field, std::size_t width, std::uint64_t value) {
  // width-1 octal digits followed by NUL
  if ((value >> (3 * (width - 1))) != 0)
    throw std::runtime_error("value " + std::to_string(value) + " too large for a " +
                             std::to_string(width) + "-byte ustar field");
  std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                static_cast<unsigned long long>(value));
}

// Split a long name into ustar prefix/name at a '/' boundary.
void put_name(Block &hdr, const std::string &name) {
  if (name.size() <= consts::kTarNameLen) {
    std::memcpy(hdr.data(), name.data(), name.size());
    return;
  }
  // A directory's own trailing '/' is never a split point.
  const auto stem_len = name.back() == '/' ? name.size() - 1 : name.size();
  const auto limit = std::min(stem_len - 1, consts::kTarPrefixLen);
  const auto cut = std::string_view(name).substr(0, stem_len).rfind('/', limit);
  if (cut == std::string::npos || cut == 0 || name.size() - cut - 1 > consts::kTarNameLen)
    throw std::runtime_error("path too long for ustar: " + name);
  std::memcpy(hdr.data(), name.data() + cut + 1, name.size() - cut - 1);
  std::memcpy(hdr.data() + 345, name.data(), cut);
}

Block make_header(const TarItem &item, std::uint64_t size, std::uint32_t mode) {
  Block hdr{};
  put_name(hdr, item.name);
  put_octal(hdr.data() + 100, 8, mode);
  put_octal(hdr.data() + 108, 8, 0); // uid
  put_octal(hdr.data() + 116, 8, 0); // gid
  put_octal(hdr.data() + 124, 12, size);
  put_octal(hdr.data() + 136, 12, 0); // mtime
  hdr[156] = item.is_dir ? consts::kTarTypeDir : consts::kTarTypeFile;
  std::memcpy(hdr.data() + 257, consts::kTarMagic.data(), consts::kTarMagic.size()); // + NUL
  hdr[263] = '0';
  hdr[264] = '0';

  // Checksum is computed with the checksum field itself read as spaces.
  std::memset(hdr.data() + 148, ' ', 8);
  unsigned sum = 0;
  for (char c : hdr)
    sum += static_cast<unsigned char>(c);
  std::snprintf(hdr.data() + 148, 7, "%06o", sum);
  hdr[155] = ' ';
  return hdr;
}

std::vector<TarItem> collect_items(const std::filesystem::path &root) {
  std::vector<TarItem> items;
  for (auto it = std::filesystem::recursive_directory_iterator(root);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    if (it->is_symlink())
      continue;
    const auto rel = it->path().lexically_relative(root).generic_string();
    if (it->is_directory())
      items.push_back(TarItem{.name = rel + "/", .path = it->path(), .is_dir = true});
    else if (it->is_regular_file())
      items.push_back(TarItem{.name = rel, .path = it->path(), .is_dir = false});
  }
  std::ranges::sort(items, [](const TarItem &a, const TarItem &b) { return a.name < b.name; });
  return items;
}

} // namespace

std::size_t write_tar_gz(const std::filesystem::path &root, const std::filesystem::path &out) {
  if (!std::filesystem::is_directory(root))
    throw std::runtime_error("archive root is not a directory: " + root.string());
  if (fs::is_within(out, root))
    throw std::runtime_error("archive " + out.string() + " would land inside " + root.string());

  const auto items = collect_items(root);
  fs::ensure_parent_dir(out);

  auto tmp = out;
  tmp += ".tmp";
  std::size_t files = 0;
  try {
    GzWriter gz{tmp};
    const Block zero{};
    for (const auto &item : items) {
      const auto perms =
          static_cast<std::uint32_t>(std::filesystem::status(item.path).permissions()) & 0777U;
      if (item.is_dir) {
        const auto hdr = make_header(item, 0, perms);
        gz.write(hdr.data(), hdr.size());
        continue;
      }
      // Header first: a file too large for ustar is refused before it is read.
      const auto size = std::filesystem::file_size(item.path);
      const auto hdr = make_header(item, size, perms);
      const auto bytes = fs::read_file(item.path);
      if (bytes.size() != size)
        throw std::runtime_error(item.path.string() + " changed while being archived");
      gz.write(hdr.data(), hdr.size());
      gz.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
      const std::size_t pad =
          (consts::kTarBlock - (bytes.size() % consts::kTarBlock)) % consts::kTarBlock;
      gz.write(zero.data(), pad);
      ++files;
    }
    // End of archive: two zero blocks.
    gz.write(zero.data(), zero.size());
    gz.write(zero.data(), zero.size());
    gz.close();
  } catch (const std::exception &) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, out, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("rename to " + out.string() + " failed");
  }
  return files;
}

} // namespace distpack
