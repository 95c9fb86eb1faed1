#include "core/types/Subnet.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <stdexcept>

namespace trafficpulse::core {

std::optional<uint32_t> parseIpv4(const std::string& address) {
    struct in_addr addr {};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string formatIpv4(uint32_t address) {
    struct in_addr addr {};
    addr.s_addr = htonl(address);

    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr, ipStr, INET_ADDRSTRLEN);
    return ipStr;
}

Ipv4Subnet Ipv4Subnet::fromString(const std::string& cidr) {
    auto slashPos = cidr.find('/');
    if (slashPos == std::string::npos) {
        throw std::invalid_argument("missing prefix length in '" + cidr + "'");
    }

    auto address = parseIpv4(cidr.substr(0, slashPos));
    if (!address) {
        throw std::invalid_argument("invalid IPv4 address in '" + cidr + "'");
    }

    std::string lengthText = cidr.substr(slashPos + 1);
    if (lengthText.empty() || lengthText.size() > 2 ||
        lengthText.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid prefix length in '" + cidr + "'");
    }

    int length = std::stoi(lengthText);
    if (length > 32) {
        throw std::invalid_argument("prefix length out of range in '" + cidr + "'");
    }

    Ipv4Subnet subnet;
    subnet.prefixLength = static_cast<uint8_t>(length);
    subnet.network = *address & subnet.mask();
    return subnet;
}

uint32_t Ipv4Subnet::mask() const {
    if (prefixLength == 0) {
        return 0;
    }
    return ~uint32_t{0} << (32 - prefixLength);
}

bool Ipv4Subnet::contains(uint32_t address) const {
    return (address & mask()) == network;
}

std::string Ipv4Subnet::toString() const {
    return formatIpv4(network) + "/" + std::to_string(prefixLength);
}

void LocalSubnetSet::addSubnet(const std::string& cidr) {
    subnets_.push_back(Ipv4Subnet::fromString(cidr));
}

bool LocalSubnetSet::isLocal(const std::string& address) const {
    auto parsed = parseIpv4(address);
    if (!parsed) {
        return false;
    }
    return isLocal(*parsed);
}

bool LocalSubnetSet::isLocal(uint32_t address) const {
    for (const auto& subnet : subnets_) {
        if (subnet.contains(address)) {
            return true;
        }
    }
    return false;
}

} // namespace trafficpulse::core
