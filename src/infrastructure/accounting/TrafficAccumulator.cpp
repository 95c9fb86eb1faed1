#include "infrastructure/accounting/TrafficAccumulator.hpp"

#include <utility>

namespace trafficpulse::infra {

void TrafficAccumulator::record(core::TrafficDirection direction, const std::string& nic,
                                const std::string& endpoint, uint64_t bytes) {
    std::lock_guard lock(mutex_);

    if (direction == core::TrafficDirection::Transmit) {
        current_.txBytes[core::TrafficKey{nic, endpoint}] += bytes;
        current_.nicTxTotal[nic] += bytes;
    } else {
        current_.rxBytes[core::TrafficKey{nic, endpoint}] += bytes;
        current_.nicRxTotal[nic] += bytes;
    }
}

core::TrafficSnapshot TrafficAccumulator::drainAndReset() {
    std::lock_guard lock(mutex_);
    return std::exchange(current_, core::TrafficSnapshot{});
}

} // namespace trafficpulse::infra
