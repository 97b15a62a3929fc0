#include "distpack/cleanup.hpp"
#include "distpack/config.hpp"
#include "distpack/pipeline.hpp"
#include "distpack/version.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>

int cmd_build(int argc, char **argv) {
  // distpack build [package] [--jobs N] [--incremental]
  std::string package;
  long jobs = 0;
  bool incremental = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if ((a == "-j" || a == "--jobs") && i + 1 < argc) {
      const std::string v = argv[++i];
      const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), jobs);
      if (ec != std::errc() || ptr != v.data() + v.size() || jobs < 1) {
        std::cerr << "build: --jobs needs a positive number\n";
        return 2;
      }
    } else if (a == "--incremental") {
      incremental = true;
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "usage: distpack build [package] [--jobs N] [--incremental]\n";
      return 2;
    } else {
      package = a;
    }
  }

  try {
    const auto root = std::filesystem::current_path();
    const auto cfg = distpack::load_config(root);
    const auto paths = distpack::package_paths(cfg, root, package);

    const auto version = distpack::read_package_version(paths.source);
    std::cout << "Building " << (package.empty() ? paths.source.filename().string() : package);
    if (version)
      std::cout << " " << *version;
    std::cout << " into " << paths.dest.string() << "\n";

    if (!incremental)
      distpack::clean(paths.dest, paths.source);

    const distpack::BuildOptions opts{
        .source_root = paths.source,
        .dest_root = paths.dest,
        .assets_subdir = cfg.assets_dir,
        .jobs = jobs > 0 ? static_cast<std::size_t>(jobs) : cfg.jobs,
        .log = &std::cout,
    };
    const auto transformers = distpack::TransformerSet::from_tools(cfg.tools, cfg.tool_timeout);
    const auto report =
        distpack::build(opts, distpack::TransformRegistry::defaults(), transformers);

    std::cout << "\n";
    distpack::print_report(std::cout, report);
    return report.exit_code();
  } catch (const std::exception &e) {
    std::cerr << "build: " << e.what() << "\n";
    return 1;
  }
}
