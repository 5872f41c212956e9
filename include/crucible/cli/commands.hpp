#pragma once

namespace crucible::cli {

/// Entry point for the `crucible` binary. Returns the process exit code; for
/// `run` that is the exit code of the executed program.
int run_cli(int argc, char **argv);

} // namespace crucible::cli
