#include "distpack/config.hpp"
#include "distpack/registry.hpp"

#include <filesystem>
#include <iostream>

int cmd_types(int /*argc*/, char ** /*argv*/) {
  try {
    const auto cfg = distpack::load_config(std::filesystem::current_path());
    for (const auto &spec : distpack::TransformRegistry::defaults().specs()) {
      std::cout << distpack::extension_text(spec.match_extension) << "  "
                << distpack::operation_name(spec.operation);
      if (spec.destination_extension)
        std::cout << " -> " << *spec.destination_extension;
      if (const auto it = cfg.tools.find(spec.operation); it != cfg.tools.end())
        std::cout << "  (" << it->second.front() << ")";
      std::cout << "\n";
    }
    std::cout << cfg.assets_dir.generic_string() << "/  "
              << distpack::operation_name(distpack::OperationKind::Copy) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "types: " << e.what() << "\n";
    return 1;
  }
}
