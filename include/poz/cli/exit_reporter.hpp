#pragma once

#include <ostream>
#include <string>

#include "poz/common.hpp"

namespace poz::cli {

// Process exit codes relied on by scripts
enum ExitCode : int {
  kExitSuccess = 0,
  kExitFailure = 1,
  kExitMissingDependency = 10,
  kExitNoInput = 11,
  kExitConfigError = 12,
  kExitApiError = 13
};

/**
 * @brief Writes result lines and maps outcomes to exit codes
 *
 * Normal output goes to `out`, "Error: ..." lines to `err`.
 */
class ExitReporter {
public:
  ExitReporter(std::ostream& out, std::ostream& err);

  // Intermediate output such as note content or the burn notice
  void info(const std::string& line);

  // Final success line; returns kExitSuccess
  int success(const std::string& line);

  // Print the error and return its exit code
  int failure(const Error& error);

  // Partial outcome: keep going after the line, without deciding the exit code
  void warning(const std::string& line);

  static int exitCodeFor(ErrorCode code);

private:
  std::ostream& out_;
  std::ostream& err_;
};

} // namespace poz::cli
