#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  distpack::cli::register_all_commands();

  if (argc < 2) {
    distpack::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    distpack::cli::print_usage(std::cout);
    return 0;
  }

  const auto fn = distpack::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "distpack: unknown command '" << cmd << "'\n";
    distpack::cli::print_usage(std::cerr);
    return 2;
  }
  // The handler sees its own name as argv[0]
  return fn(argc - 1, argv + 1);
}
