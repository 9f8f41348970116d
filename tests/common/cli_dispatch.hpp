#ifndef REFINERY_TESTS_COMMON_CLI_DISPATCH_HPP_
#define REFINERY_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "refinery/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace refinery::tests::common {

struct CliOutcome {
  int exit_code = -1;
  std::string out;
  std::string err;
};

// Runs one CLI invocation in-process with stdout/stderr captured.
inline CliOutcome DispatchCaptured(std::vector<std::string> argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  CliOutcome outcome;
  outcome.exit_code = refinery::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);

  outcome.out = captured_out.str();
  outcome.err = captured_err.str();
  return outcome;
}

} // namespace refinery::tests::common

#endif // REFINERY_TESTS_COMMON_CLI_DISPATCH_HPP_
