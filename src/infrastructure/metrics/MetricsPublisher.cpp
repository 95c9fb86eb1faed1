#include "infrastructure/metrics/MetricsPublisher.hpp"

#include <spdlog/spdlog.h>

namespace trafficpulse::infra {

MetricsPublisher::MetricsPublisher(AsioContext& context, TrafficAccumulator& accumulator,
                                   MetricsRegistry& registry, std::chrono::seconds window)
    : accumulator_(accumulator),
      window_(window.count() > 0 ? window : std::chrono::seconds(1)),
      strand_(asio::make_strand(context.getContext())), timer_(strand_) {
    ipTx_ = registry.registerGauge(kIpTxMetric, "TX bits per second per IP", {"local_ip", "nic"});
    ipRx_ = registry.registerGauge(kIpRxMetric, "RX bits per second per IP", {"local_ip", "nic"});
    nicTx_ = registry.registerGauge(kNicTxMetric, "Total TX bits per second per NIC", {"nic"});
    nicRx_ = registry.registerGauge(kNicRxMetric, "Total RX bits per second per NIC", {"nic"});
    frames_ = registry.registerCounter(kFramesMetric, "Frames seen by the capture loop",
                                       {"result"});
    errors_ = registry.registerCounter(kErrorsMetric, "Non-timeout capture read failures");
}

MetricsPublisher::~MetricsPublisher() {
    stop();
}

void MetricsPublisher::setStatisticsProvider(StatisticsProvider provider) {
    std::lock_guard lock(providerMutex_);
    statisticsProvider_ = std::move(provider);
}

void MetricsPublisher::start() {
    if (running_.exchange(true)) {
        return;
    }

    nextTick_ = std::chrono::steady_clock::now();
    scheduleNextTick();
    spdlog::info("Publishing traffic metrics every {}s", window_.count());
}

void MetricsPublisher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (auto self = weak_from_this().lock()) {
        asio::post(strand_, [self]() { self->timer_.cancel(); });
    } else {
        timer_.cancel();
    }
}

void MetricsPublisher::scheduleNextTick() {
    if (!running_.load()) {
        return;
    }

    // Ticks stay on the schedule anchored at start()
    nextTick_ += window_;
    timer_.expires_at(nextTick_);

    auto self = shared_from_this();
    timer_.async_wait([this, self](const asio::error_code& ec) {
        if (ec || !running_.load()) {
            return;
        }

        publishOnce();
        scheduleNextTick();
    });
}

double MetricsPublisher::toBitsPerSecond(uint64_t bytes) const {
    return static_cast<double>(bytes) * 8.0 / static_cast<double>(window_.count());
}

void MetricsPublisher::publishOnce() {
    auto snapshot = accumulator_.drainAndReset();

    for (const auto& [key, bytes] : snapshot.txBytes) {
        ipTx_->set({key.endpoint, key.nic}, toBitsPerSecond(bytes));
    }
    for (const auto& [key, bytes] : snapshot.rxBytes) {
        ipRx_->set({key.endpoint, key.nic}, toBitsPerSecond(bytes));
    }
    for (const auto& [nic, bytes] : snapshot.nicTxTotal) {
        nicTx_->set({nic}, toBitsPerSecond(bytes));
    }
    for (const auto& [nic, bytes] : snapshot.nicRxTotal) {
        nicRx_->set({nic}, toBitsPerSecond(bytes));
    }

    StatisticsProvider provider;
    {
        std::lock_guard lock(providerMutex_);
        provider = statisticsProvider_;
    }

    if (provider) {
        auto stats = provider();
        frames_->set({"received"}, static_cast<double>(stats.framesReceived));
        frames_->set({"accounted"}, static_cast<double>(stats.framesAccounted));
        frames_->set({"skipped"}, static_cast<double>(stats.framesSkipped));
        errors_->set({}, static_cast<double>(stats.captureErrors));
    }

    spdlog::trace("Published window: {} tx series, {} rx series", snapshot.txBytes.size(),
                  snapshot.rxBytes.size());
}

} // namespace trafficpulse::infra
