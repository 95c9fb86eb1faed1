#pragma once

#include "core/types/EgressMapping.hpp"

#include <memory>
#include <shared_mutex>
#include <string>

namespace trafficpulse::infra {

/**
 * @brief Thread-safe holder of the current endpoint-to-egress mapping.
 *
 * The mapping is kept as an immutable snapshot behind a shared pointer. Readers
 * copy the pointer under a shared lock and resolve against that copy, so a
 * concurrent replace() can never expose a partially updated mapping.
 */
class EgressResolver {
public:
    /**
     * @brief Constructs a resolver holding an initial mapping.
     * @param initial The mapping to start with.
     */
    explicit EgressResolver(core::EgressMapping initial = core::EgressMapping::defaults());

    EgressResolver(const EgressResolver&) = delete;
    EgressResolver& operator=(const EgressResolver&) = delete;

    /**
     * @brief Resolves the egress interface name for an endpoint.
     * @param endpoint Endpoint address in dotted-decimal form.
     * @return Physical interface name from the current snapshot.
     */
    std::string resolve(const std::string& endpoint) const;

    /**
     * @brief Replaces the current mapping wholesale.
     * @param mapping The new mapping.
     */
    void replace(core::EgressMapping mapping);

    /**
     * @brief Returns the current snapshot.
     */
    std::shared_ptr<const core::EgressMapping> current() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const core::EgressMapping> snapshot_;
};

} // namespace trafficpulse::infra
