#include "tutorplane/cli/commands.hpp"

int main(int argc, char **argv) { return tutorplane::cli::run_cli(argc, argv); }
