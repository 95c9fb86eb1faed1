/**
 * @file EgressMapping.hpp
 * @brief Endpoint-to-egress mapping snapshot.
 *
 * This file defines the NIC naming triple and the immutable mapping snapshot
 * published by the mapping authority.
 */

#pragma once

#include <map>
#include <string>

namespace trafficpulse::core {

/**
 * @brief Physical interface names for the local side and the two egress paths.
 */
struct NicConfig {
    std::string lan{"eth2"};  ///< Local-side interface, used for capture by default
    std::string wan0{"eth0"}; ///< Interface of the primary egress path
    std::string wan1{"eth1"}; ///< Interface of the secondary egress path

    bool operator==(const NicConfig& other) const = default;
};

/**
 * @brief A complete endpoint-to-egress mapping.
 *
 * Snapshots are treated as immutable values: a refresh builds a new snapshot
 * and replaces the old one wholesale.
 */
struct EgressMapping {
    static constexpr const char* kPrimaryTag = "wan0";
    static constexpr const char* kSecondaryTag = "wan1";

    NicConfig config;                            ///< Interface names
    std::map<std::string, std::string> mappings; ///< Endpoint address -> egress tag

    /**
     * @brief Resolves the egress interface for an endpoint.
     *
     * Endpoints that are absent, or tagged with anything other than "wan0" or
     * "wan1", resolve to the primary egress interface.
     *
     * @param endpoint Endpoint address in dotted-decimal form.
     * @return Physical interface name.
     */
    [[nodiscard]] const std::string& resolve(const std::string& endpoint) const;

    /**
     * @brief Returns the built-in mapping used when the authority is unreachable.
     * @return Mapping with lan=eth2, wan0=eth0, wan1=eth1 and no endpoints.
     */
    static EgressMapping defaults();

    bool operator==(const EgressMapping& other) const = default;
};

} // namespace trafficpulse::core
