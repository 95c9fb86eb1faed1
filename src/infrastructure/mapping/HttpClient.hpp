#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace trafficpulse::infra {

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};                          ///< HTTP status code (e.g., 200, 404).
    std::map<std::string, std::string> headers; ///< Response headers with lowercase keys.
    std::string body;                           ///< Response body content.
    std::string errorMessage;                   ///< Error message if request failed.
    bool success{false};                        ///< True if a 2xx response was received.
};

/**
 * @brief Components of an http:// URL.
 */
struct HttpUrl {
    std::string host;    ///< Host name or address.
    std::string port;    ///< Port, "80" if the URL has none.
    std::string target;  ///< Path and query, "/" if the URL has none.
};

/**
 * @brief Callback type for async HTTP request completion.
 */
using HttpCallback = std::function<void(const HttpResponse&)>;

/**
 * @brief Asynchronous HTTP/1.0 GET client on top of the shared AsioContext.
 *
 * Every request runs on its own strand with a deadline timer; whichever of the
 * response or the deadline comes first completes the request, and the callback
 * is invoked exactly once.
 */
class HttpClient {
public:
    /// Upper bound on the size of a response, headers included.
    static constexpr size_t kMaxResponseSize = 4 * 1024 * 1024;

    /**
     * @brief Constructs an HttpClient.
     * @param context AsioContext that runs the request handlers.
     */
    explicit HttpClient(AsioContext& context);

    /**
     * @brief Performs an asynchronous HTTP GET request.
     * @param url Target URL (http:// only).
     * @param timeoutMs Overall request timeout in milliseconds.
     * @param callback Function called when the request completes.
     */
    void getAsync(const std::string& url, int timeoutMs, HttpCallback callback);

    /**
     * @brief Splits an http:// URL into host, port and target.
     * @return The parts, or nullopt if the URL is not a valid http:// URL.
     */
    static std::optional<HttpUrl> parseUrl(const std::string& url);

    /**
     * @brief Parses a complete raw HTTP response.
     * @param raw Status line, headers and body as received.
     * @return Parsed response; success is false if the status line is malformed.
     */
    static HttpResponse parseResponse(const std::string& raw);

private:
    AsioContext& context_;
};

} // namespace trafficpulse::infra
