#pragma once

#include "core/types/Subnet.hpp"
#include "infrastructure/accounting/EgressResolver.hpp"
#include "infrastructure/accounting/TrafficAccumulator.hpp"
#include "infrastructure/api/MetricsHttpServer.hpp"
#include "infrastructure/capture/CaptureLoop.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/mapping/HttpMappingAuthority.hpp"
#include "infrastructure/mapping/MappingRefresher.hpp"
#include "infrastructure/metrics/MetricsPublisher.hpp"
#include "infrastructure/metrics/MetricsRegistry.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <filesystem>
#include <memory>

namespace trafficpulse::app {

/**
 * @brief Owns and wires every component of the agent.
 *
 * Construction performs the whole startup sequence and throws if the capture
 * device cannot be opened or the metrics port cannot be bound.
 */
class Application {
public:
    static constexpr const char* kVersion = "1.0.0";
    static constexpr const char* kDefaultConfigDir = "/etc/trafficpulse";

    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Blocks until SIGINT or SIGTERM is received, then shuts down.
     * @return Process exit status.
     */
    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::EgressResolver& resolver() { return *resolver_; }
    infra::MetricsRegistry& registry() { return *registry_; }

private:
    void initializeLogging();
    void initializeSubnets();
    void initializeMapping();
    void initializeComponents();
    void shutdown();

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;

    core::LocalSubnetSet subnets_;
    core::EgressMapping initialMapping_;
    std::shared_ptr<infra::HttpMappingAuthority> authority_;
    std::unique_ptr<infra::EgressResolver> resolver_;
    std::unique_ptr<infra::TrafficAccumulator> accumulator_;
    std::unique_ptr<infra::MetricsRegistry> registry_;

    std::unique_ptr<infra::CaptureLoop> captureLoop_;
    std::shared_ptr<infra::MetricsPublisher> publisher_;
    std::shared_ptr<infra::MappingRefresher> refresher_;
    std::shared_ptr<infra::MetricsHttpServer> httpServer_;

    bool shutDown_{false};
};

} // namespace trafficpulse::app
