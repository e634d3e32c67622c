#include "poz/api/transport_client.hpp"

#include <cstdint>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace poz::api {

using poz::core::ApiResult;
using poz::core::StatusCategory;

namespace {

// Poznote returns ids as numbers; accept strings too
std::optional<std::string> idToString(const nlohmann::json& id) {
  if (id.is_number_integer()) {
    return std::to_string(id.get<int64_t>());
  }
  if (id.is_string() && !id.get<std::string>().empty()) {
    return id.get<std::string>();
  }
  return std::nullopt;
}

std::string stringField(const nlohmann::json& object, const char* key, const std::string& fallback) {
  auto it = object.find(key);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

}  // namespace

CurlTransport::CurlTransport(std::chrono::seconds timeout) : client_(timeout) {
}

Result<poz::util::HttpResponse> CurlTransport::send(const poz::util::HttpRequest& request) {
  return client_.send(request);
}

TransportClient::TransportClient(Transport& transport, const poz::config::Config& config)
    : transport_(transport), urls_(config) {
}

StatusCategory TransportClient::classifyStatus(int status_code) {
  if (status_code >= 200 && status_code <= 299) {
    return StatusCategory::kSuccess;
  }
  if (status_code == 401 || status_code == 403) {
    return StatusCategory::kUnauthorized;
  }
  if (status_code == 404) {
    return StatusCategory::kNotFound;
  }
  if (status_code >= 500 && status_code <= 599) {
    return StatusCategory::kServerError;
  }
  return StatusCategory::kClientError;
}

StatusCategory TransportClient::classifyTransportError(const Error& error) {
  return error.code() == ErrorCode::kTimeout ? StatusCategory::kTimeout : StatusCategory::kNetworkError;
}

ApiResult TransportClient::execute(const ApiRequest& request) {
  ApiResult result;

  auto response = transport_.send(request.http);
  if (!response.has_value()) {
    result.category = classifyTransportError(response.error());
    result.message = response.error().message();
    spdlog::info("{} {} failed: {}", request.http.method, request.http.url, result.message);
    return result;
  }

  result.http_status = response->status_code;
  result.raw_body = std::move(response->body);
  result.category = classifyStatus(result.http_status);
  spdlog::info("{} {} -> {} ({})", request.http.method, request.http.url, result.http_status,
               poz::core::statusCategoryToString(result.category));

  if (result.ok()) {
    extractPayload(request, result);
  }
  return result;
}

void TransportClient::extractPayload(const ApiRequest& request, ApiResult& result) const {
  if (request.shape == ResponseShape::kDeleted) {
    result.note_id = request.target_id;
    return;
  }

  auto json = nlohmann::json::parse(result.raw_body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    if (!result.raw_body.empty()) {
      spdlog::warn("Response body is not a JSON object");
    }
    json = nlohmann::json::object();
  }

  switch (request.shape) {
    case ResponseShape::kCreated:
    case ResponseShape::kUpdated: {
      auto note = json.find("note");
      if (note != json.end() && note->is_object() && note->contains("id")) {
        result.note_id = idToString((*note)["id"]);
      }
      if (!result.note_id.has_value()) {
        result.note_id = request.target_id;
      }
      break;
    }
    case ResponseShape::kListing: {
      auto notes = json.find("notes");
      if (notes != json.end() && notes->is_array() && !notes->empty()) {
        const auto& first = notes->front();
        if (first.is_object() && first.contains("id")) {
          if (auto id = idToString(first["id"])) {
            poz::core::NoteSummary summary;
            summary.id = *id;
            summary.heading = stringField(first, "heading", "No Title");
            summary.content = stringField(first, "content", "");
            result.note_id = summary.id;
            result.note = std::move(summary);
          }
        }
      }
      break;
    }
    case ResponseShape::kDeleted:
      break;
  }

  if (result.note_id.has_value()) {
    result.note_url = urls_.noteUrl(*result.note_id);
  }
}

} // namespace poz::api
