#include "infrastructure/capture/FrameDecoder.hpp"

namespace trafficpulse::infra {

namespace {

uint16_t readUint16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

uint32_t readUint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

} // namespace

std::optional<DecodedFrame> FrameDecoder::decodeEthernet(const uint8_t* data,
                                                         size_t capturedLength,
                                                         uint64_t frameLength) {
    if (data == nullptr || capturedLength < kEthernetHeaderLength + kIpv4MinHeaderLength) {
        return std::nullopt;
    }

    // EtherType follows the destination and source MAC addresses
    if (readUint16(data + 12) != kEtherTypeIpv4) {
        return std::nullopt;
    }

    const uint8_t* ipHeader = data + kEthernetHeaderLength;
    size_t available = capturedLength - kEthernetHeaderLength;

    uint8_t version = ipHeader[0] >> 4;
    size_t headerLength = static_cast<size_t>((ipHeader[0] & 0x0F) * 4);
    if (version != 4 || headerLength < kIpv4MinHeaderLength || headerLength > available) {
        return std::nullopt;
    }

    DecodedFrame frame;
    frame.sourceAddress = readUint32(ipHeader + 12);
    frame.destinationAddress = readUint32(ipHeader + 16);
    frame.frameLength = frameLength;
    return frame;
}

} // namespace trafficpulse::infra
