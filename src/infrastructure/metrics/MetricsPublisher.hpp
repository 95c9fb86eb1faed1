#pragma once

#include "infrastructure/accounting/TrafficAccumulator.hpp"
#include "infrastructure/capture/CaptureLoop.hpp"
#include "infrastructure/metrics/MetricsRegistry.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace trafficpulse::infra {

/**
 * @brief Converts each window's byte counters into bits-per-second gauges.
 *
 * On every tick the accumulator is drained and each counter is published as
 * bytes * 8 / window seconds. Series that saw no traffic in a window keep
 * their previously published value.
 *
 * @note This class is non-copyable. Create it with std::make_shared; the timer
 *       handler keeps the publisher alive while a tick is pending.
 */
class MetricsPublisher : public std::enable_shared_from_this<MetricsPublisher> {
public:
    static constexpr const char* kIpTxMetric = "network_ip_tx_bps";
    static constexpr const char* kIpRxMetric = "network_ip_rx_bps";
    static constexpr const char* kNicTxMetric = "network_ip_tx_bps_total";
    static constexpr const char* kNicRxMetric = "network_ip_rx_bps_total";
    static constexpr const char* kFramesMetric = "trafficpulse_capture_frames_total";
    static constexpr const char* kErrorsMetric = "trafficpulse_capture_errors_total";

    /// Supplies the capture counters exported alongside the traffic gauges.
    using StatisticsProvider = std::function<CaptureStatistics()>;

    /**
     * @brief Constructs a publisher and registers its metric families.
     * @param context AsioContext that runs the window timer.
     * @param accumulator Accumulator drained on every tick.
     * @param registry Registry the gauges are registered in.
     * @param window Length of a reporting window.
     * @throws std::invalid_argument if the gauges are already registered.
     */
    MetricsPublisher(AsioContext& context, TrafficAccumulator& accumulator,
                     MetricsRegistry& registry,
                     std::chrono::seconds window = std::chrono::seconds(1));

    ~MetricsPublisher();

    MetricsPublisher(const MetricsPublisher&) = delete;
    MetricsPublisher& operator=(const MetricsPublisher&) = delete;

    /**
     * @brief Sets the source of capture counters published on each tick.
     */
    void setStatisticsProvider(StatisticsProvider provider);

    /**
     * @brief Starts the window timer. Has no effect if already running.
     */
    void start();

    /**
     * @brief Cancels the window timer.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Drains the accumulator once and updates all gauges.
     */
    void publishOnce();

    std::chrono::seconds window() const { return window_; }

private:
    void scheduleNextTick();
    double toBitsPerSecond(uint64_t bytes) const;

    TrafficAccumulator& accumulator_;
    std::chrono::seconds window_;

    std::shared_ptr<MetricFamily> ipTx_;
    std::shared_ptr<MetricFamily> ipRx_;
    std::shared_ptr<MetricFamily> nicTx_;
    std::shared_ptr<MetricFamily> nicRx_;
    std::shared_ptr<MetricFamily> frames_;
    std::shared_ptr<MetricFamily> errors_;

    std::mutex providerMutex_;
    StatisticsProvider statisticsProvider_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::chrono::steady_clock::time_point nextTick_;
    std::atomic<bool> running_{false};
};

} // namespace trafficpulse::infra
