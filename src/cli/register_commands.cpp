#include "cli/registry.hpp"

int cmd_build(int argc, char **argv);
int cmd_clean(int argc, char **argv);
int cmd_manifest(int, char **);
int cmd_pack(int, char **);
int cmd_types(int, char **);

namespace distpack::cli {

void register_all_commands() {
  register_command("build", ::cmd_build, "[package] [--jobs N] [--incremental]",
                   "run every stage; exits 1 if any file failed");
  register_command("clean", ::cmd_clean, "[package]", "remove the distribution tree");
  register_command("manifest", ::cmd_manifest, "[package]",
                   "print the sha256 of every built file");
  register_command("pack", ::cmd_pack, "[package]",
                   "archive the built tree as <package>[-<version>].tar.gz");
  register_command("types", ::cmd_types, "", "list the registered file types and their stages");
}

} // namespace distpack::cli
