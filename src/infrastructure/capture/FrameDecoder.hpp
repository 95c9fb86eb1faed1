#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace trafficpulse::infra {

/**
 * @brief Network-layer addressing extracted from a captured frame.
 */
struct DecodedFrame {
    uint32_t sourceAddress{0};      ///< IPv4 source address in host byte order
    uint32_t destinationAddress{0}; ///< IPv4 destination address in host byte order
    uint64_t frameLength{0};        ///< On-wire frame length in bytes

    bool operator==(const DecodedFrame& other) const = default;
};

/**
 * @brief Decodes Ethernet II frames carrying IPv4.
 *
 * Only the Ethernet header and the fixed part of the IPv4 header are read;
 * payload bytes are never inspected.
 */
class FrameDecoder {
public:
    static constexpr size_t kEthernetHeaderLength = 14;
    static constexpr size_t kIpv4MinHeaderLength = 20;
    static constexpr uint16_t kEtherTypeIpv4 = 0x0800;

    /**
     * @brief Decodes an Ethernet frame.
     * @param data Captured frame bytes.
     * @param capturedLength Number of bytes available at @p data.
     * @param frameLength On-wire length of the frame, reported as the byte count.
     * @return Decoded addresses, or nullopt for non-IPv4, truncated or malformed frames.
     */
    static std::optional<DecodedFrame> decodeEthernet(const uint8_t* data, size_t capturedLength,
                                                      uint64_t frameLength);
};

} // namespace trafficpulse::infra
