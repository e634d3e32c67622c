#include "poz/common.hpp"

#include <sstream>

namespace poz {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kMissingDependency:
      return "Missing dependency";
    case ErrorCode::kNoInput:
      return "No input";
    case ErrorCode::kMissingCredentials:
      return "Missing credentials";
    case ErrorCode::kAdvancedFeaturesDisabled:
      return "Advanced features disabled";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kHttpError:
      return "HTTP error";
    case ErrorCode::kServerError:
      return "Server error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kExternalToolError:
      return "External tool error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kInterrupted:
      return "Interrupted";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef POZ_VERSION_BUILD
  return Version{1, 0, 0, POZ_VERSION_BUILD};
#else
  return Version{1, 0, 0, ""};
#endif
}

}  // namespace poz
