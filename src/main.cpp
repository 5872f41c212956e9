#include "crucible/cli/commands.hpp"

int main(int argc, char **argv) { return crucible::cli::run_cli(argc, argv); }
