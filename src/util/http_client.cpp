#include "poz/util/http_client.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <new>
#include <stdexcept>

namespace poz::util {

struct HttpClient::Impl {
    CURL* curl = nullptr;
    std::chrono::seconds timeout;

    explicit Impl(std::chrono::seconds request_timeout) : timeout(request_timeout) {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HttpClient::HttpClient(std::chrono::seconds timeout) : pImpl(std::make_unique<Impl>(timeout)) {
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    if (!pImpl || !pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    std::string response_body;
    long response_code = 0;

    // Reset curl handle
    curl_easy_reset(pImpl->curl);

    curl_easy_setopt(pImpl->curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_NOSIGNAL, 1L);

    if (!request.body.empty()) {
        curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
    } else if (request.method == "GET") {
        curl_easy_setopt(pImpl->curl, CURLOPT_HTTPGET, 1L);
    }

    // Set headers
    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
        curl_easy_setopt(pImpl->curl, CURLOPT_HTTPHEADER, header_list);
    }

    // Set callback for response body
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEDATA, &response_body);

    curl_easy_setopt(pImpl->curl, CURLOPT_TIMEOUT, static_cast<long>(pImpl->timeout.count()));

    spdlog::debug("{} {}", request.method, request.url);

    CURLcode res = curl_easy_perform(pImpl->curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(makeError(ErrorCode::kTimeout,
                                       "Request timed out after " + std::to_string(pImpl->timeout.count()) + "s"));
    }
    if (res != CURLE_OK) {
        return std::unexpected(makeError(ErrorCode::kNetworkError,
                                       "HTTP request failed: " + std::string(curl_easy_strerror(res))));
    }

    curl_easy_getinfo(pImpl->curl, CURLINFO_RESPONSE_CODE, &response_code);
    spdlog::debug("HTTP {} ({} bytes)", response_code, response_body.size());

    HttpResponse response;
    response.status_code = static_cast<int>(response_code);
    response.body = std::move(response_body);

    return response;
}

std::string urlEncode(std::string_view value) {
    // A zero length makes curl_easy_escape fall back to strlen
    if (value.empty()) {
        return "";
    }
    // libcurl ignores the handle argument of curl_easy_escape since 7.82
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())), &curl_free);
    if (!escaped) {
        throw std::bad_alloc();
    }
    return std::string(escaped.get());
}

} // namespace poz::util
