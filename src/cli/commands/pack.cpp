#include "distpack/archive.hpp"
#include "distpack/config.hpp"
#include "distpack/version.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_pack(int argc, char **argv) {
  const std::string package = argc > 1 ? argv[1] : "";
  try {
    const auto root = std::filesystem::current_path();
    const auto paths = distpack::package_paths(distpack::load_config(root), root, package);
    if (!std::filesystem::is_directory(paths.dest)) {
      std::cerr << "pack: nothing built at " << paths.dest.string() << " (run `distpack build`)\n";
      return 1;
    }

    std::string stem = paths.dest.filename().string();
    if (const auto version = distpack::read_package_version(paths.source))
      stem += "-" + *version;
    const auto out = paths.dest.parent_path() / (stem + ".tar.gz");

    const auto n = distpack::write_tar_gz(paths.dest, out);
    std::cout << "Packed " << n << " files into " << out.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "pack: " << e.what() << "\n";
    return 1;
  }
}
