#pragma once

#include <chrono>
#include <memory>

#include "poz/common.hpp"
#include "poz/api/request_builder.hpp"
#include "poz/config/config.hpp"
#include "poz/core/api_result.hpp"
#include "poz/util/http_client.hpp"

namespace poz::api {

/**
 * @brief Sends one HTTP request
 */
class Transport {
public:
  virtual ~Transport() = default;

  // Any HTTP status is a value; only transport failures are errors
  virtual Result<poz::util::HttpResponse> send(const poz::util::HttpRequest& request) = 0;
};

// Transport backed by libcurl
class CurlTransport : public Transport {
public:
  // Throws std::runtime_error when libcurl cannot be initialized
  explicit CurlTransport(std::chrono::seconds timeout);

  Result<poz::util::HttpResponse> send(const poz::util::HttpRequest& request) override;

private:
  poz::util::HttpClient client_;
};

/**
 * @brief Executes API requests and classifies their outcome
 *
 * Never fails: every outcome, including transport errors, is an ApiResult.
 */
class TransportClient {
public:
  TransportClient(Transport& transport, const poz::config::Config& config);

  poz::core::ApiResult execute(const ApiRequest& request);

  // 2xx success, 401/403 unauthorized, 404 not found, 5xx server error
  static poz::core::StatusCategory classifyStatus(int status_code);

  // Category for a failed send (kTimeout or network error)
  static poz::core::StatusCategory classifyTransportError(const Error& error);

private:
  void extractPayload(const ApiRequest& request, poz::core::ApiResult& result) const;

  Transport& transport_;
  RequestBuilder urls_;
};

} // namespace poz::api
