#include "infrastructure/mapping/HttpClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <sstream>

namespace trafficpulse::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

struct PendingRequest {
    using Strand = asio::strand<asio::io_context::executor_type>;

    explicit PendingRequest(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), socket(strand), deadline(strand),
          responseBuffer(HttpClient::kMaxResponseSize) {}

    void fail(const std::string& message) {
        HttpResponse response;
        response.success = false;
        response.errorMessage = message;
        complete(response);
    }

    void complete(const HttpResponse& response) {
        if (completed) {
            return;
        }
        completed = true;

        asio::error_code ec;
        deadline.cancel();
        resolver.cancel();
        socket.close(ec);

        callback(response);
    }

    Strand strand;
    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer deadline;
    asio::streambuf responseBuffer;
    std::string requestText;
    HttpCallback callback;
    bool completed{false};
};

} // namespace

HttpClient::HttpClient(AsioContext& context) : context_(context) {}

std::optional<HttpUrl> HttpClient::parseUrl(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    auto slashPos = rest.find('/');
    std::string authority = rest.substr(0, slashPos);

    HttpUrl parsed;
    parsed.target = (slashPos == std::string::npos) ? "/" : rest.substr(slashPos);

    auto colonPos = authority.rfind(':');
    if (colonPos != std::string::npos) {
        parsed.host = authority.substr(0, colonPos);
        parsed.port = authority.substr(colonPos + 1);
        if (parsed.port.empty() ||
            parsed.port.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
    } else {
        parsed.host = authority;
        parsed.port = "80";
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

HttpResponse HttpClient::parseResponse(const std::string& raw) {
    HttpResponse response;

    auto headerEnd = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, headerEnd);
    if (headerEnd != std::string::npos) {
        response.body = raw.substr(headerEnd + 4);
    }

    std::istringstream iss(head);
    std::string line;
    if (!std::getline(iss, line)) {
        response.errorMessage = "Empty response";
        return response;
    }

    std::istringstream statusLine(trim(line));
    std::string version;
    statusLine >> version >> response.statusCode;
    if (version.compare(0, 5, "HTTP/") != 0 || response.statusCode == 0) {
        response.statusCode = 0;
        response.errorMessage = "Malformed status line";
        return response;
    }

    while (std::getline(iss, line)) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            response.headers[key] = trim(line.substr(colonPos + 1));
        }
    }

    auto lengthIt = response.headers.find("content-length");
    if (lengthIt != response.headers.end()) {
        try {
            auto length = std::stoull(lengthIt->second);
            if (length < response.body.size()) {
                response.body.resize(length);
            }
        } catch (const std::exception&) {
            response.errorMessage = "Invalid Content-Length";
            return response;
        }
    }

    response.success = response.statusCode >= 200 && response.statusCode < 300;
    if (!response.success) {
        response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
    }
    return response;
}

void HttpClient::getAsync(const std::string& url, int timeoutMs, HttpCallback callback) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        HttpResponse response;
        response.errorMessage = "Unsupported URL: " + url;
        callback(response);
        return;
    }

    auto request = std::make_shared<PendingRequest>(context_.getContext());
    request->callback = std::move(callback);

    std::ostringstream text;
    text << "GET " << parsed->target << " HTTP/1.0\r\n";
    text << "Host: " << parsed->host << ":" << parsed->port << "\r\n";
    text << "Accept: application/json\r\n";
    text << "Connection: close\r\n\r\n";
    request->requestText = text.str();

    // Everything below runs on the request's strand, including the deadline
    asio::dispatch(request->strand, [request, host = parsed->host, port = parsed->port,
                                     timeoutMs, url]() {
        request->deadline.expires_after(std::chrono::milliseconds(timeoutMs));
        request->deadline.async_wait([request](const asio::error_code& ec) {
            if (!ec) {
                request->fail("Request timed out");
            }
        });

        request->resolver.async_resolve(
            host, port,
            [request](const asio::error_code& ec,
                      const asio::ip::tcp::resolver::results_type& endpoints) {
                if (ec) {
                    request->fail("Resolve failed: " + ec.message());
                    return;
                }

                asio::async_connect(
                    request->socket, endpoints,
                    [request](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                        if (ec) {
                            request->fail("Connect failed: " + ec.message());
                            return;
                        }

                        asio::async_write(
                            request->socket, asio::buffer(request->requestText),
                            [request](const asio::error_code& ec, std::size_t) {
                                if (ec) {
                                    request->fail("Write failed: " + ec.message());
                                    return;
                                }

                                asio::async_read(
                                    request->socket, request->responseBuffer,
                                    [request](const asio::error_code& ec, std::size_t) {
                                        if (ec && ec != asio::error::eof) {
                                            request->fail("Read failed: " + ec.message());
                                            return;
                                        }

                                        std::string raw(
                                            (std::istreambuf_iterator<char>(
                                                &request->responseBuffer)),
                                            std::istreambuf_iterator<char>());
                                        request->complete(parseResponse(raw));
                                    });
                            });
                    });
            });

        spdlog::debug("HTTP GET request sent to: {}", url);
    });
}

} // namespace trafficpulse::infra
