#include <catch2/catch_test_macros.hpp>

#include "core/services/ICaptureSource.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/accounting/EgressResolver.hpp"
#include "infrastructure/accounting/TrafficAccumulator.hpp"
#include "infrastructure/api/MetricsHttpServer.hpp"
#include "infrastructure/capture/CaptureLoop.hpp"
#include "infrastructure/metrics/MetricsPublisher.hpp"
#include "infrastructure/metrics/MetricsRegistry.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <array>
#include <chrono>
#include <deque>
#include <thread>
#include <vector>

using namespace trafficpulse::core;
using namespace trafficpulse::infra;

namespace {

std::vector<uint8_t> makeIpv4Frame(const std::string& source, const std::string& destination,
                                   size_t length) {
    std::vector<uint8_t> frame(length, 0);
    frame[12] = 0x08;
    frame[13] = 0x00;
    frame[14] = 0x45;

    auto writeAddress = [&frame](size_t offset, uint32_t address) {
        frame[offset] = static_cast<uint8_t>(address >> 24);
        frame[offset + 1] = static_cast<uint8_t>(address >> 16);
        frame[offset + 2] = static_cast<uint8_t>(address >> 8);
        frame[offset + 3] = static_cast<uint8_t>(address);
    };
    writeAddress(26, *parseIpv4(source));
    writeAddress(30, *parseIpv4(destination));
    return frame;
}

// Offline-style source: replays frames once, then reports end of stream
class ReplayCaptureSource : public ICaptureSource {
public:
    void add(std::vector<uint8_t> frame) { frames_.push_back(std::move(frame)); }

    CaptureResult next() override {
        CaptureResult result;
        if (position_ >= frames_.size()) {
            result.status = CaptureStatus::EndOfStream;
            return result;
        }

        const auto& frame = frames_[position_++];
        result.status = CaptureStatus::Frame;
        result.data = frame.data();
        result.capturedLength = frame.size();
        result.frameLength = frame.size();
        return result;
    }

    int linkType() const override { return kLinkTypeEthernet; }
    std::string name() const override { return "replay"; }

private:
    std::deque<std::vector<uint8_t>> frames_;
    size_t position_{0};
};

std::string scrape(uint16_t port) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    asio::ip::tcp::resolver resolver(io);
    asio::connect(socket, resolver.resolve("127.0.0.1", std::to_string(port)));
    asio::write(socket, asio::buffer(std::string(
                            "GET /metrics HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n")));

    std::string response;
    std::array<char, 8192> chunk{};
    asio::error_code ec;
    while (!ec) {
        size_t len = socket.read_some(asio::buffer(chunk), ec);
        response.append(chunk.data(), len);
    }

    auto bodyStart = response.find("\r\n\r\n");
    return bodyStart == std::string::npos ? "" : response.substr(bodyStart + 4);
}

void waitForCapture(const CaptureLoop& loop) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (loop.isRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Capture to Prometheus scrape
// =============================================================================

TEST_CASE("Traffic accounting pipeline - capture to scrape",
          "[Integration][Pipeline][Metrics]") {
    AsioContext context(2);
    context.start();

    LocalSubnetSet subnets;
    subnets.addSubnet("10.40.0.0/20");

    EgressMapping mapping;
    mapping.mappings["10.40.1.5"] = "wan1";
    EgressResolver resolver(mapping);
    TrafficAccumulator accumulator;
    MetricsRegistry registry;

    auto publisher = std::make_shared<MetricsPublisher>(context, accumulator, registry);

    const uint16_t port = 18911;
    auto server = std::make_shared<MetricsHttpServer>(context, registry, port, "1.0.0");
    server->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    SECTION("Upload from an endpoint tagged wan0 is reported on eth0") {
        mapping.mappings["10.40.1.5"] = "wan0";
        resolver.replace(mapping);

        auto source = std::make_unique<ReplayCaptureSource>();
        source->add(makeIpv4Frame("10.40.1.5", "8.8.8.8", 1500));

        CaptureLoop loop(std::move(source), subnets, resolver, accumulator);
        loop.start();
        waitForCapture(loop);
        publisher->publishOnce();

        auto body = scrape(port);
        CHECK(contains(body, "network_ip_tx_bps{local_ip=\"10.40.1.5\",nic=\"eth0\"} 12000\n"));
        CHECK(contains(body, "network_ip_tx_bps_total{nic=\"eth0\"} 12000\n"));
        CHECK_FALSE(contains(body, "network_ip_rx_bps{local_ip=\"10.40.1.5\""));
        CHECK_FALSE(contains(body, "network_ip_rx_bps_total"));
    }

    SECTION("Single upload frame becomes transmit gauges on the egress NIC") {
        auto source = std::make_unique<ReplayCaptureSource>();
        source->add(makeIpv4Frame("10.40.1.5", "8.8.8.8", 1500));

        CaptureLoop loop(std::move(source), subnets, resolver, accumulator);
        publisher->setStatisticsProvider([&loop]() { return loop.statistics(); });
        loop.start();
        waitForCapture(loop);
        publisher->publishOnce();

        auto body = scrape(port);
        CHECK(contains(body, "network_ip_tx_bps{local_ip=\"10.40.1.5\",nic=\"eth1\"} 12000\n"));
        CHECK(contains(body, "network_ip_tx_bps_total{nic=\"eth1\"} 12000\n"));
        CHECK_FALSE(contains(body, "network_ip_rx_bps{"));
        CHECK(contains(body, "trafficpulse_capture_frames_total{result=\"accounted\"} 1\n"));
        CHECK(contains(body, "trafficpulse_capture_errors_total 0\n"));
    }

    SECTION("Local to local traffic is counted on both sides") {
        auto source = std::make_unique<ReplayCaptureSource>();
        source->add(makeIpv4Frame("10.40.1.5", "10.40.2.7", 1000));
        source->add(makeIpv4Frame("1.1.1.1", "10.40.2.7", 500));
        source->add(makeIpv4Frame("1.1.1.1", "8.8.8.8", 700));

        CaptureLoop loop(std::move(source), subnets, resolver, accumulator);
        loop.start();
        waitForCapture(loop);
        publisher->publishOnce();

        auto body = scrape(port);
        CHECK(contains(body, "network_ip_tx_bps{local_ip=\"10.40.1.5\",nic=\"eth1\"} 8000\n"));
        CHECK(contains(body, "network_ip_rx_bps{local_ip=\"10.40.2.7\",nic=\"eth0\"} 12000\n"));
        CHECK(contains(body, "network_ip_tx_bps_total{nic=\"eth1\"} 8000\n"));
        CHECK(contains(body, "network_ip_rx_bps_total{nic=\"eth0\"} 12000\n"));
        CHECK_FALSE(contains(body, "1.1.1.1"));
        CHECK_FALSE(contains(body, "8.8.8.8"));
    }

    SECTION("Quiet window leaves the last values in place") {
        auto source = std::make_unique<ReplayCaptureSource>();
        source->add(makeIpv4Frame("10.40.1.5", "8.8.8.8", 1500));

        CaptureLoop loop(std::move(source), subnets, resolver, accumulator);
        loop.start();
        waitForCapture(loop);
        publisher->publishOnce();
        publisher->publishOnce();

        auto body = scrape(port);
        CHECK(contains(body, "network_ip_tx_bps{local_ip=\"10.40.1.5\",nic=\"eth1\"} 12000\n"));
    }

    server->stop();
    context.stop();
}
