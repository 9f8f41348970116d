#pragma once

namespace refinery::core::errors {

// Process-exit contract for the `refinery` CLI.
//
// 0/1/2 keep their conventional meanings (success, command failure, usage).
// Higher values let wrappers branch on configuration and convergence outcomes
// without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kNotConverged = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace refinery::core::errors
