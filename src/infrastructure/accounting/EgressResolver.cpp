#include "infrastructure/accounting/EgressResolver.hpp"

#include <mutex>

namespace trafficpulse::infra {

EgressResolver::EgressResolver(core::EgressMapping initial)
    : snapshot_(std::make_shared<const core::EgressMapping>(std::move(initial))) {}

std::string EgressResolver::resolve(const std::string& endpoint) const {
    return current()->resolve(endpoint);
}

void EgressResolver::replace(core::EgressMapping mapping) {
    auto next = std::make_shared<const core::EgressMapping>(std::move(mapping));

    std::unique_lock lock(mutex_);
    snapshot_.swap(next);
}

std::shared_ptr<const core::EgressMapping> EgressResolver::current() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

} // namespace trafficpulse::infra
