#include "app/Application.hpp"

#include "infrastructure/capture/PcapCaptureSource.hpp"

#include <asio.hpp>
#include <csignal>
#include <future>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace trafficpulse::app {

namespace {

std::chrono::seconds positiveSeconds(int value, const char* setting) {
    if (value < 1) {
        spdlog::warn("Invalid {} ({}), using 1 second", setting, value);
        return std::chrono::seconds(1);
    }
    return std::chrono::seconds(value);
}

} // namespace

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeSubnets();

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(2);
    asioContext_->start();

    initializeMapping();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(cfg.logLevel));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!cfg.logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.logFile, static_cast<size_t>(cfg.logMaxSizeMb) * 1024 * 1024,
            static_cast<size_t>(cfg.logMaxFiles));
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("trafficpulse", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("TrafficPulse {} starting...", kVersion);
    spdlog::info("Configuration: {}", config_->configPath().string());
    if (!cfg.logFile.empty()) {
        spdlog::info("Log file: {}", cfg.logFile);
    }
}

void Application::initializeSubnets() {
    for (const auto& cidr : config_->config().localSubnets) {
        try {
            subnets_.addSubnet(cidr);
            spdlog::info("Added local subnet: {}", cidr);
        } catch (const std::invalid_argument& e) {
            spdlog::error("Failed to parse subnet '{}': {}", cidr, e.what());
        }
    }

    if (subnets_.empty()) {
        spdlog::warn("No local subnets configured, no traffic will be accounted");
    }
}

void Application::initializeMapping() {
    const auto& cfg = config_->config();
    authority_ = std::make_shared<infra::HttpMappingAuthority>(*asioContext_, cfg.mappingUrl,
                                                               cfg.mappingTimeoutMs);

    auto result = authority_->fetch().get();
    if (result.success) {
        initialMapping_ = result.mapping;
        spdlog::info("Fetched NIC mappings: {}",
                     infra::HttpMappingAuthority::mappingToJson(initialMapping_).dump());
    } else {
        initialMapping_ = core::EgressMapping::defaults();
        spdlog::error("Failed to fetch NIC mappings: {}", result.errorMessage);
        spdlog::info("Using default configuration");
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Accounting
    resolver_ = std::make_unique<infra::EgressResolver>(initialMapping_);
    accumulator_ = std::make_unique<infra::TrafficAccumulator>();

    // Metrics
    registry_ = std::make_unique<infra::MetricsRegistry>();
    registry_->registerGauge("trafficpulse_build_info", "TrafficPulse build information",
                             {"version"})
        ->set({kVersion}, 1.0);

    // Capture source
    std::unique_ptr<core::ICaptureSource> source;
    if (!cfg.captureFile.empty()) {
        source = infra::PcapCaptureSource::openOffline(cfg.captureFile);
        spdlog::info("Replaying capture file {}", cfg.captureFile);
    } else {
        std::string device =
            cfg.captureInterface.empty() ? initialMapping_.config.lan : cfg.captureInterface;
        infra::CaptureOptions options;
        options.snaplen = cfg.captureSnaplen;
        options.timeoutMs = cfg.captureTimeoutMs;
        options.promiscuous = cfg.capturePromiscuous;
        source = infra::PcapCaptureSource::openLive(device, options);
        spdlog::info("Capturing on {} (snaplen {}, timeout {} ms, promiscuous {})", device,
                     options.snaplen, options.timeoutMs, options.promiscuous);
    }

    captureLoop_ = std::make_unique<infra::CaptureLoop>(std::move(source), subnets_, *resolver_,
                                                        *accumulator_);

    publisher_ = std::make_shared<infra::MetricsPublisher>(
        *asioContext_, *accumulator_, *registry_,
        positiveSeconds(cfg.publishIntervalSeconds, "publish interval"));
    publisher_->setStatisticsProvider([this]() { return captureLoop_->statistics(); });

    refresher_ = std::make_shared<infra::MappingRefresher>(
        *asioContext_, authority_, *resolver_,
        positiveSeconds(cfg.mappingRefreshIntervalSeconds, "mapping refresh interval"));

    httpServer_ = std::make_shared<infra::MetricsHttpServer>(*asioContext_, *registry_,
                                                             cfg.metricsPort, kVersion);
    httpServer_->start();

    captureLoop_->start();
    publisher_->start();
    refresher_->start();

    spdlog::info("Application components initialized");
}

int Application::run() {
    std::promise<int> signalled;
    auto signalFuture = signalled.get_future();

    asio::signal_set signals(asioContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([&signalled](const asio::error_code& ec, int signalNumber) {
        if (!ec) {
            signalled.set_value(signalNumber);
        }
    });

    int signalNumber = signalFuture.get();
    spdlog::info("Received signal {}, shutting down", signalNumber);

    shutdown();
    return 0;
}

void Application::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    spdlog::info("Application shutting down...");

    if (httpServer_) {
        httpServer_->stop();
    }
    if (refresher_) {
        refresher_->stop();
    }
    if (publisher_) {
        publisher_->stop();
    }
    if (captureLoop_) {
        captureLoop_->stop();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
}

} // namespace trafficpulse::app
