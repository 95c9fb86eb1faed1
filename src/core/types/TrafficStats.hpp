/**
 * @file TrafficStats.hpp
 * @brief Traffic accounting keys and per-window snapshots.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <string>

namespace trafficpulse::core {

/**
 * @brief Direction of a packet relative to a local endpoint.
 */
enum class TrafficDirection : int {
    Transmit = 0, ///< The endpoint is the packet source
    Receive = 1   ///< The endpoint is the packet destination
};

/**
 * @brief Composite accounting key of egress interface and endpoint address.
 */
struct TrafficKey {
    std::string nic;      ///< Egress interface name
    std::string endpoint; ///< Local endpoint address

    auto operator<=>(const TrafficKey& other) const = default;
    bool operator==(const TrafficKey& other) const = default;
};

/**
 * @brief Byte counters collected during one reporting window.
 *
 * Per-NIC totals are maintained alongside the per-key counters so both always
 * describe the same window.
 */
struct TrafficSnapshot {
    std::map<TrafficKey, uint64_t> txBytes;      ///< Transmit bytes per (nic, endpoint)
    std::map<TrafficKey, uint64_t> rxBytes;      ///< Receive bytes per (nic, endpoint)
    std::map<std::string, uint64_t> nicTxTotal;  ///< Transmit bytes per nic
    std::map<std::string, uint64_t> nicRxTotal;  ///< Receive bytes per nic

    [[nodiscard]] bool empty() const {
        return txBytes.empty() && rxBytes.empty() && nicTxTotal.empty() && nicRxTotal.empty();
    }

    bool operator==(const TrafficSnapshot& other) const = default;
};

} // namespace trafficpulse::core
