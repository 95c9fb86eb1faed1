#pragma once

#include "infrastructure/metrics/MetricsRegistry.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace trafficpulse::infra {

/// Methods the exposition server distinguishes. Anything else is OTHER.
enum class HttpMethod { GET, HEAD, OTHER };

/**
 * @brief Represents an incoming HTTP request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::OTHER};       ///< HTTP method of the request.
    std::string path;                           ///< Request path, query string dropped.
    std::map<std::string, std::string> headers; ///< Headers with lowercase keys.
};

/**
 * @brief Represents an HTTP response to send.
 */
struct ApiResponse {
    int statusCode{200};                        ///< HTTP status code.
    std::string statusText{"OK"};               ///< HTTP status text.
    std::string body;                           ///< Response body content.
    std::map<std::string, std::string> headers; ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     * @param json JSON object to serialize as body.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets a plain-text body with the given content type.
     */
    void setText(const std::string& text, const std::string& contentType);

    /**
     * @brief Sets a JSON error response.
     * @param code HTTP status code for the error.
     * @param message Error message.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Converts the response to an HTTP/1.1 response string.
     * @param includeBody False for HEAD requests; Content-Length still reports the body size.
     */
    std::string toString(bool includeBody = true) const;
};

/**
 * @brief Handler function type for route endpoints.
 */
using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition.
 */
struct Route {
    HttpMethod method;    ///< HTTP method this route handles.
    std::string path;     ///< Exact request path.
    RouteHandler handler; ///< Handler function for this route.
};

/**
 * @brief Pull endpoint serving the metrics registry.
 *
 * Serves GET /metrics in Prometheus text format and GET /health as JSON.
 * Requests never touch accounting state; each connection handles a single
 * request and is closed after the response. A connection that has not
 * received its request and been answered within the request timeout is closed.
 *
 * @note This class is non-copyable. Create it with std::make_shared.
 */
class MetricsHttpServer : public std::enable_shared_from_this<MetricsHttpServer> {
public:
    static constexpr size_t kMaxRequestSize = 16 * 1024;
    static constexpr std::chrono::milliseconds kDefaultRequestTimeout{5000};

    /**
     * @brief Constructs a MetricsHttpServer.
     * @param asioContext AsioContext for async I/O.
     * @param registry Registry rendered on GET /metrics.
     * @param port TCP port to listen on.
     * @param version Version string reported by GET /health.
     */
    MetricsHttpServer(AsioContext& asioContext, const MetricsRegistry& registry, uint16_t port,
                      std::string version = "");

    ~MetricsHttpServer();

    MetricsHttpServer(const MetricsHttpServer&) = delete;
    MetricsHttpServer& operator=(const MetricsHttpServer&) = delete;

    /**
     * @brief Binds the listening socket and starts accepting connections.
     * @throws asio::system_error if the port cannot be bound.
     */
    void start();

    /**
     * @brief Closes the listening socket.
     */
    void stop();

    bool isRunning() const { return running_.load(); }
    uint16_t port() const { return port_; }

    /**
     * @brief Sets how long a connection may take to send its request and read the reply.
     *
     * Call before start().
     */
    void setRequestTimeout(std::chrono::milliseconds timeout) { requestTimeout_ = timeout; }

    /**
     * @brief Parses a raw request head into an ApiRequest.
     */
    static ApiRequest parseRequest(const std::string& rawRequest);

    /**
     * @brief Routes a parsed request and fills in the response.
     */
    void dispatch(const ApiRequest& request, ApiResponse& response) const;

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                      std::shared_ptr<asio::steady_timer> deadline, const ApiResponse& response,
                      bool includeBody);

    void registerRoutes();
    void handleMetrics(const ApiRequest& req, ApiResponse& res) const;
    void handleHealth(const ApiRequest& req, ApiResponse& res) const;

    AsioContext& asioContext_;
    const MetricsRegistry& registry_;
    uint16_t port_;
    std::string version_;
    std::atomic<bool> running_{false};
    std::chrono::milliseconds requestTimeout_{kDefaultRequestTimeout};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace trafficpulse::infra
