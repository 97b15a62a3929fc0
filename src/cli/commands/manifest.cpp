#include "distpack/config.hpp"
#include "distpack/manifest.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_manifest(int argc, char **argv) {
  const std::string package = argc > 1 ? argv[1] : "";
  try {
    const auto root = std::filesystem::current_path();
    const auto paths = distpack::package_paths(distpack::load_config(root), root, package);
    if (!std::filesystem::is_directory(paths.dest)) {
      std::cerr << "manifest: nothing built at " << paths.dest.string()
                << " (run `distpack build`)\n";
      return 1;
    }
    for (const auto &[path, hex] : distpack::build_manifest(paths.dest))
      std::cout << hex << "  " << path << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "manifest: " << e.what() << "\n";
    return 1;
  }
}
