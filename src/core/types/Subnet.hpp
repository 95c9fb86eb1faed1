/**
 * @file Subnet.hpp
 * @brief IPv4 prefix types and the local subnet classifier.
 *
 * This file defines the CIDR prefix value type and the ordered set of local
 * prefixes used to decide whether an address belongs to the local network.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trafficpulse::core {

/**
 * @brief Parses a dotted-decimal IPv4 address.
 * @param address Address text (e.g., "10.40.1.5").
 * @return Address in host byte order, or nullopt if the text is not a valid address.
 */
std::optional<uint32_t> parseIpv4(const std::string& address);

/**
 * @brief Formats a host-order IPv4 address as dotted-decimal text.
 */
std::string formatIpv4(uint32_t address);

/**
 * @brief An IPv4 network prefix in CIDR notation.
 *
 * The stored network address always has its host bits cleared.
 */
struct Ipv4Subnet {
    uint32_t network{0};    ///< Network address in host byte order
    uint8_t prefixLength{0}; ///< Prefix length in bits (0-32)

    /**
     * @brief Parses a CIDR string such as "10.40.0.0/20".
     *
     * Host bits in the address part are accepted and masked off.
     *
     * @param cidr The CIDR text.
     * @return The parsed subnet.
     * @throws std::invalid_argument if the text is not a valid IPv4 CIDR.
     */
    static Ipv4Subnet fromString(const std::string& cidr);

    /**
     * @brief Returns the netmask for this prefix in host byte order.
     */
    [[nodiscard]] uint32_t mask() const;

    /**
     * @brief Checks whether an address falls inside this prefix.
     * @param address Address in host byte order.
     */
    [[nodiscard]] bool contains(uint32_t address) const;

    /**
     * @brief Formats the subnet back to CIDR notation.
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Ipv4Subnet& other) const = default;
};

/**
 * @brief Ordered set of local network prefixes.
 *
 * Built once at startup from configuration and only read afterwards. Membership
 * is a linear scan over the configured prefixes.
 */
class LocalSubnetSet {
public:
    LocalSubnetSet() = default;

    /**
     * @brief Parses and appends a CIDR prefix.
     * @param cidr Prefix text (e.g., "192.168.1.0/24").
     * @throws std::invalid_argument if the prefix cannot be parsed.
     */
    void addSubnet(const std::string& cidr);

    /**
     * @brief Checks whether a dotted-decimal address is local.
     *
     * Malformed addresses are reported as not local.
     */
    [[nodiscard]] bool isLocal(const std::string& address) const;

    /**
     * @brief Checks whether a host-order address is local.
     */
    [[nodiscard]] bool isLocal(uint32_t address) const;

    [[nodiscard]] const std::vector<Ipv4Subnet>& subnets() const { return subnets_; }
    [[nodiscard]] bool empty() const { return subnets_.empty(); }

private:
    std::vector<Ipv4Subnet> subnets_;
};

} // namespace trafficpulse::core
