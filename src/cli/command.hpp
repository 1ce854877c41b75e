#pragma once

namespace zit::cli {

// Subcommand handler: argv[0] is the subcommand name. Returns the exit code.
using command_fn = int (*)(int argc, char **argv);

} // namespace zit::cli
