#include "infrastructure/api/MetricsHttpServer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace trafficpulse::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string statusTextFor(int code) {
    switch (code) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 500:
        return "Internal Server Error";
    default:
        return "Error";
    }
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setText(const std::string& text, const std::string& contentType) {
    body = text;
    headers["Content-Type"] = contentType;
}

void ApiResponse::setError(int code, const std::string& message) {
    statusCode = code;
    statusText = statusTextFor(code);

    nlohmann::json error;
    error["error"] = message;
    error["status"] = code;
    setJson(error);
}

std::string ApiResponse::toString(bool includeBody) const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    if (includeBody) {
        ss << body;
    }
    return ss.str();
}

MetricsHttpServer::MetricsHttpServer(AsioContext& asioContext, const MetricsRegistry& registry,
                                     uint16_t port, std::string version)
    : asioContext_(asioContext), registry_(registry), port_(port), version_(std::move(version)) {
    registerRoutes();
}

MetricsHttpServer::~MetricsHttpServer() {
    stop();
}

void MetricsHttpServer::registerRoutes() {
    routes_.push_back(
        {HttpMethod::GET, "/metrics", [this](auto& req, auto& res) { handleMetrics(req, res); }});
    routes_.push_back(
        {HttpMethod::GET, "/health", [this](auto& req, auto& res) { handleHealth(req, res); }});
}

void MetricsHttpServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
            asioContext_.getContext(), asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port_));

        running_ = true;
        startAccept();
        spdlog::info("Prometheus metrics server listening on http://0.0.0.0:{}/metrics", port_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start metrics server on port {}: {}", port_, e.what());
        acceptor_.reset();
        throw;
    }
}

void MetricsHttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    spdlog::info("Metrics server stopped");
}

void MetricsHttpServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    // Each connection's socket and deadline share one strand
    auto socket =
        std::make_shared<asio::ip::tcp::socket>(asio::make_strand(asioContext_.getContext()));
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void MetricsHttpServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(kMaxRequestSize);
    auto deadline = std::make_shared<asio::steady_timer>(socket->get_executor());
    auto self = shared_from_this();

    deadline->expires_after(requestTimeout_);
    deadline->async_wait([socket](const asio::error_code& ec) {
        if (!ec) {
            spdlog::debug("Closing metrics connection that missed its deadline");
            asio::error_code ignored;
            socket->close(ignored);
        }
    });

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer, deadline](const asio::error_code& ec, std::size_t /*bytes*/) {
            ApiResponse response;

            if (ec == asio::error::not_found) {
                response.setError(400, "Request header too large");
                sendResponse(socket, deadline, response, true);
                return;
            }
            if (ec) {
                deadline->cancel();
                return;
            }

            std::string rawRequest((std::istreambuf_iterator<char>(&*buffer)),
                                   std::istreambuf_iterator<char>());
            auto request = parseRequest(rawRequest);
            dispatch(request, response);
            sendResponse(socket, deadline, response, request.method != HttpMethod::HEAD);
        });
}

void MetricsHttpServer::dispatch(const ApiRequest& request, ApiResponse& response) const {
    spdlog::debug("Scrape request for {}", request.path);

    bool pathFound = false;
    for (const auto& route : routes_) {
        if (route.path != request.path) {
            continue;
        }
        pathFound = true;

        // HEAD is answered by the GET handler
        bool methodMatches =
            route.method == request.method ||
            (route.method == HttpMethod::GET && request.method == HttpMethod::HEAD);
        if (!methodMatches) {
            continue;
        }

        try {
            route.handler(request, response);
        } catch (const std::exception& e) {
            spdlog::error("Error handling {}: {}", request.path, e.what());
            response = ApiResponse{};
            response.setError(500, "Internal server error");
        }
        return;
    }

    if (pathFound) {
        response.setError(405, "Method not allowed");
        response.headers["Allow"] = "GET";
    } else {
        response.setError(404, "Endpoint not found");
    }
}

void MetricsHttpServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                                     std::shared_ptr<asio::steady_timer> deadline,
                                     const ApiResponse& response, bool includeBody) {
    auto wire = std::make_shared<std::string>(response.toString(includeBody));

    // The deadline keeps running until the response is written
    asio::async_write(*socket, asio::buffer(*wire),
                      [socket, deadline, wire](const asio::error_code& ec, std::size_t /*bytes*/) {
                          deadline->cancel();
                          if (ec) {
                              spdlog::debug("Failed to send response: {}", ec.message());
                          }
                          asio::error_code ignored;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                      });
}

ApiRequest MetricsHttpServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        if (method == "GET") {
            request.method = HttpMethod::GET;
        } else if (method == "HEAD") {
            request.method = HttpMethod::HEAD;
        }
        request.path = path.substr(0, path.find('?'));
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::string value = trim(line.substr(colonPos + 1));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[key] = value;
        }
    }

    return request;
}

void MetricsHttpServer::handleMetrics(const ApiRequest& /*req*/, ApiResponse& res) const {
    res.setText(registry_.serialize(), MetricsRegistry::kContentType);
}

void MetricsHttpServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) const {
    nlohmann::json response;
    response["status"] = "healthy";
    response["version"] = version_;
    res.setJson(response);
}

} // namespace trafficpulse::infra
