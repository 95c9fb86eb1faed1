#pragma once

#include "core/types/TrafficStats.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace trafficpulse::infra {

/**
 * @brief Lock-guarded byte counters for the current reporting window.
 *
 * Written by the capture loop and drained by the metrics publisher. Every
 * operation holds the lock only for the duration of the map update, so a
 * record lands entirely in one drained window or the next.
 *
 * @note This class is non-copyable.
 */
class TrafficAccumulator {
public:
    TrafficAccumulator() = default;

    TrafficAccumulator(const TrafficAccumulator&) = delete;
    TrafficAccumulator& operator=(const TrafficAccumulator&) = delete;

    /**
     * @brief Adds a frame's length to the counters of one direction.
     * @param direction Transmit or receive, relative to @p endpoint.
     * @param nic Egress interface the endpoint resolves to.
     * @param endpoint Local endpoint address.
     * @param bytes Frame length in bytes.
     */
    void record(core::TrafficDirection direction, const std::string& nic,
                const std::string& endpoint, uint64_t bytes);

    /**
     * @brief Returns the counters collected so far and starts a new window.
     * @return All four counter maps; the accumulator is empty afterwards.
     */
    core::TrafficSnapshot drainAndReset();

private:
    mutable std::mutex mutex_;
    core::TrafficSnapshot current_;
};

} // namespace trafficpulse::infra
