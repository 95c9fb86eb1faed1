#include "core/types/EgressMapping.hpp"

namespace trafficpulse::core {

const std::string& EgressMapping::resolve(const std::string& endpoint) const {
    auto it = mappings.find(endpoint);
    if (it == mappings.end()) {
        return config.wan0;
    }

    if (it->second == kSecondaryTag) {
        return config.wan1;
    }
    return config.wan0;
}

EgressMapping EgressMapping::defaults() {
    return EgressMapping{};
}

} // namespace trafficpulse::core
