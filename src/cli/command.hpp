#pragma once

namespace distpack::cli {

// argv[0] is the subcommand name; returns the process exit status
using command_fn = int (*)(int argc, char **argv);

} // namespace distpack::cli
