#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "poz/common.hpp"

namespace poz::util {

struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    bool operator==(const HttpRequest&) const = default;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
};

class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(10));
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /**
     * Perform one request. Any HTTP status is a successful result; only
     * transport failures are errors (kTimeout when the deadline expires,
     * kNetworkError otherwise).
     */
    Result<HttpResponse> send(const HttpRequest& request);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Percent-encode a query component with curl_easy_escape (RFC 3986 unreserved set kept)
std::string urlEncode(std::string_view value);

} // namespace poz::util
