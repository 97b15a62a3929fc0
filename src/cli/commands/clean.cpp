#include "distpack/cleanup.hpp"
#include "distpack/config.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_clean(int argc, char **argv) {
  const std::string package = argc > 1 ? argv[1] : "";
  try {
    const auto root = std::filesystem::current_path();
    const auto paths = distpack::package_paths(distpack::load_config(root), root, package);
    std::cout << "Cleaning " << paths.dest.string() << "\n";
    distpack::clean(paths.dest, paths.source);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "clean: " << e.what() << "\n";
    return 1;
  }
}
