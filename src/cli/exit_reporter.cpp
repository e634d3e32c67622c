#include "poz/cli/exit_reporter.hpp"

#include <spdlog/spdlog.h>

namespace poz::cli {

ExitReporter::ExitReporter(std::ostream& out, std::ostream& err) : out_(out), err_(err) {
}

void ExitReporter::info(const std::string& line) {
  out_ << line << "\n";
}

int ExitReporter::success(const std::string& line) {
  out_ << line << std::endl;
  return kExitSuccess;
}

int ExitReporter::failure(const Error& error) {
  out_.flush();
  err_ << "Error: " << error.message() << std::endl;
  int code = exitCodeFor(error.code());
  spdlog::debug("Exiting with {} ({})", code, errorCodeToString(error.code()));
  return code;
}

void ExitReporter::warning(const std::string& line) {
  out_.flush();
  err_ << "Warning: " << line << std::endl;
}

int ExitReporter::exitCodeFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return kExitSuccess;
    case ErrorCode::kMissingDependency:
    case ErrorCode::kExternalToolError:
    case ErrorCode::kProcessError:
    case ErrorCode::kSystemError:
      return kExitMissingDependency;
    case ErrorCode::kNoInput:
      return kExitNoInput;
    case ErrorCode::kMissingCredentials:
    case ErrorCode::kAdvancedFeaturesDisabled:
    case ErrorCode::kConfigError:
    case ErrorCode::kInvalidArgument:
      return kExitConfigError;
    case ErrorCode::kUnauthorized:
    case ErrorCode::kNotFound:
    case ErrorCode::kHttpError:
    case ErrorCode::kServerError:
    case ErrorCode::kNetworkError:
    case ErrorCode::kTimeout:
    case ErrorCode::kParseError:
    case ErrorCode::kInterrupted:
      return kExitApiError;
    case ErrorCode::kUnknownError:
      return kExitFailure;
  }
  return kExitFailure;
}

} // namespace poz::cli
