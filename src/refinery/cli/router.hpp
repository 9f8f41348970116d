#pragma once

namespace refinery::cli {

// Routes `refinery` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration file rejected
//   30 => `simulate --require-convergence` finished without converging
int Dispatch(int argc, char** argv);

} // namespace refinery::cli
