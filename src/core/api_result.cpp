#include "poz/core/api_result.hpp"

namespace poz::core {

namespace {

constexpr size_t kMaxBodyExcerpt = 200;

std::string bodyExcerpt(const std::string& body) {
  std::string excerpt = body.substr(0, kMaxBodyExcerpt);
  for (char& c : excerpt) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  if (body.size() > kMaxBodyExcerpt) {
    excerpt += "...";
  }
  return excerpt;
}

}  // namespace

std::string_view statusCategoryToString(StatusCategory category) {
  switch (category) {
    case StatusCategory::kSuccess:
      return "success";
    case StatusCategory::kUnauthorized:
      return "unauthorized";
    case StatusCategory::kNotFound:
      return "not found";
    case StatusCategory::kClientError:
      return "client error";
    case StatusCategory::kServerError:
      return "server error";
    case StatusCategory::kNetworkError:
      return "network error";
    case StatusCategory::kTimeout:
      return "timeout";
  }
  return "unknown";
}

Error ApiResult::toError() const {
  ErrorCode code = ErrorCode::kUnknownError;
  switch (category) {
    case StatusCategory::kSuccess:
      code = ErrorCode::kSuccess;
      break;
    case StatusCategory::kUnauthorized:
      code = ErrorCode::kUnauthorized;
      break;
    case StatusCategory::kNotFound:
      code = ErrorCode::kNotFound;
      break;
    case StatusCategory::kClientError:
      code = ErrorCode::kHttpError;
      break;
    case StatusCategory::kServerError:
      code = ErrorCode::kServerError;
      break;
    case StatusCategory::kNetworkError:
      code = ErrorCode::kNetworkError;
      break;
    case StatusCategory::kTimeout:
      code = ErrorCode::kTimeout;
      break;
  }

  std::string text = "API request failed: ";
  if (http_status != 0) {
    text += std::string(statusCategoryToString(category)) + " (HTTP " + std::to_string(http_status) + ")";
    if (!raw_body.empty()) {
      text += ": " + bodyExcerpt(raw_body);
    }
  } else {
    text += message.empty() ? std::string(statusCategoryToString(category)) : message;
  }
  return makeError(code, text);
}

}  // namespace poz::core
