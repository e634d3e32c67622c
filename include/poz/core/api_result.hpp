#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "poz/common.hpp"

namespace poz::core {

enum class StatusCategory {
  kSuccess,       // 2xx
  kUnauthorized,  // 401, 403
  kNotFound,      // 404
  kClientError,   // any other non-2xx below 500
  kServerError,   // 5xx
  kNetworkError,  // connection, DNS, TLS failures
  kTimeout        // request deadline expired
};

std::string_view statusCategoryToString(StatusCategory category);

// First note of a listing or search response
struct NoteSummary {
  std::string id;
  std::string heading;
  std::string content;
};

// Classified outcome of one request
struct ApiResult {
  StatusCategory category = StatusCategory::kNetworkError;
  int http_status = 0;                 // 0 when no response was received
  std::optional<std::string> note_id;
  std::optional<std::string> note_url;
  std::optional<NoteSummary> note;     // listing responses only
  std::string raw_body;
  std::string message;                 // transport error text

  bool ok() const { return category == StatusCategory::kSuccess; }

  // Error describing a non-success result
  Error toError() const;
};

}  // namespace poz::core
