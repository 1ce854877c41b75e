#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_log(int, char **);
int cmd_diff(int, char **);

namespace zit::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize a new repository");
  register_command("add", ::cmd_add, "Stage file(s): zit add <file>...");
  register_command("commit", ::cmd_commit, "Commit staged files: zit commit -m <message>");
  register_command("log", ::cmd_log, "Show commit history from HEAD");
  register_command("diff", ::cmd_diff, "Show what a commit changed: zit diff <commit>");
}

} // namespace zit::cli
