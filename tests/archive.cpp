#include "distpack/archive.hpp"
#include "distpack/version.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <zlib.h>

namespace fs = std::filesystem;

static void write_text(const fs::path &p, const std::string &s) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary);
  ofs << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static std::string gunzip(const fs::path &p) {
  gzFile f = gzopen(p.string().c_str(), "rb");
  if (!f)
    return {};
  std::string out;
  char buf[4096];
  int n = 0;
  while ((n = gzread(f, buf, sizeof(buf))) > 0)
    out.append(buf, static_cast<std::size_t>(n));
  gzclose(f);
  return out;
}

int main() {
  const fs::path base = fs::temp_directory_path() /
                        ("distpack_archive_test_" + std::to_string(std::random_device{}()));
  const fs::path dist = base / "dist" / "pkg";

  try {
    write_text(dist / "app" / "main.pyc", "compiled-bytes");
    write_text(dist / "static" / "app.js", "var a;");
    // 130-char path: needs the ustar prefix field
    const std::string outer(60, 'd');
    const std::string inner(60, 'e');
    write_text(dist / outer / inner / "long.txt", "long");

    const fs::path out = base / "dist" / "pkg-1.0.tar.gz";
    const auto n = distpack::write_tar_gz(dist, out);
    if (n != 3) {
      std::cerr << "archived " << n << " files, expected 3\n";
      return 1;
    }

    const std::string tar = gunzip(out);
    if (tar.size() % 512 != 0 || tar.size() < 512 * 3) {
      std::cerr << "tar stream size " << tar.size() << "\n";
      return 1;
    }
    // Sorted: the first entry is the app/ directory
    if (std::strncmp(tar.data(), "app/", 100) != 0 || tar[156] != '5') {
      std::cerr << "first entry is not app/\n";
      return 1;
    }
    if (std::memcmp(tar.data() + 257, "ustar", 6) != 0) {
      std::cerr << "missing ustar magic\n";
      return 1;
    }
    unsigned sum = 0;
    for (int i = 0; i < 512; ++i)
      sum += (i >= 148 && i < 156) ? ' ' : static_cast<unsigned char>(tar[i]);
    if (std::stoul(std::string(tar.data() + 148, 6), nullptr, 8) != sum) {
      std::cerr << "bad header checksum\n";
      return 1;
    }
    // Second block: app/main.pyc header, third: its content
    if (std::strncmp(tar.data() + 512, "app/main.pyc", 100) != 0 ||
        tar.compare(1024, 14, "compiled-bytes") != 0) {
      std::cerr << "file entry wrong\n";
      return 1;
    }
    if (tar.find("long.txt") == std::string::npos) {
      std::cerr << "long path entry missing\n";
      return 1;
    }

    // Deterministic bytes for an unchanged tree
    const fs::path again = base / "again.tar.gz";
    distpack::write_tar_gz(dist, again);
    if (slurp(out) != slurp(again)) {
      std::cerr << "archive not reproducible\n";
      return 1;
    }

    bool threw = false;
    try {
      distpack::write_tar_gz(dist, dist / "self.tar.gz");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw || fs::exists(dist / "self.tar.gz")) {
      std::cerr << "archive inside its own root was allowed\n";
      return 1;
    }

    // A file whose size needs more than 11 octal digits cannot be described by ustar
    const fs::path big = base / "big";
    write_text(big / "huge.bin", "");
    fs::resize_file(big / "huge.bin", std::uintmax_t{8} << 30); // sparse, 8 GiB
    threw = false;
    try {
      distpack::write_tar_gz(big, base / "big.tar.gz");
    } catch (const std::runtime_error &e) {
      threw = std::string(e.what()).find("too large") != std::string::npos;
    }
    if (!threw || fs::exists(base / "big.tar.gz") || fs::exists(base / "big.tar.gz.tmp")) {
      std::cerr << "oversized file was not refused\n";
      return 1;
    }
    fs::remove_all(big);

    // Package version used to name archives
    write_text(base / "src" / "pkg" / "__init__.py",
               "import os\n__version__ = \"1.0.3\"\nGUNICORN_CONF_PATH = ''\n");
    const auto v = distpack::read_package_version(base / "src" / "pkg");
    if (!v || *v != "1.0.3") {
      std::cerr << "version not read\n";
      return 1;
    }
    write_text(base / "src" / "other" / "__init__.py", "__version__ = '2.1'\n");
    if (distpack::read_package_version(base / "src" / "other").value_or("") != "2.1") {
      std::cerr << "single-quoted version not read\n";
      return 1;
    }
    if (distpack::read_package_version(base / "src" / "none")) {
      std::cerr << "version invented for a package without __init__.py\n";
      return 1;
    }

    std::cout << "archive OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    fs::remove_all(base, ec);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
