/**
 * @file ICaptureSource.hpp
 * @brief Interface for link-layer frame sources.
 *
 * This file defines the abstract source the capture loop pulls raw frames from,
 * along with the outcome of a single read.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace trafficpulse::core {

/**
 * @brief Outcome of a single read from a capture source.
 */
enum class CaptureStatus : int {
    Frame = 0,       ///< A frame was read
    Timeout = 1,     ///< No frame arrived within the read timeout
    Error = 2,       ///< The source reported a read failure
    EndOfStream = 3  ///< An offline source has no more frames
};

/**
 * @brief Result of ICaptureSource::next().
 *
 * For CaptureStatus::Frame, @c data points into a buffer owned by the source
 * and stays valid until the next call to next().
 */
struct CaptureResult {
    CaptureStatus status{CaptureStatus::Timeout}; ///< Read outcome
    const uint8_t* data{nullptr};  ///< Captured bytes (Frame only)
    size_t capturedLength{0};      ///< Number of bytes available at @c data
    uint64_t frameLength{0};       ///< On-wire length of the frame
    std::string errorMessage;      ///< Source error text (Error only)
};

/**
 * @brief Interface for a blocking source of raw link-layer frames.
 *
 * Implementations block in next() for at most their configured read timeout.
 */
class ICaptureSource {
public:
    /// Link-layer type value for Ethernet (matches DLT_EN10MB).
    static constexpr int kLinkTypeEthernet = 1;

    virtual ~ICaptureSource() = default;

    /**
     * @brief Reads the next frame.
     * @return The read outcome and, for a frame, its bytes and length.
     */
    virtual CaptureResult next() = 0;

    /**
     * @brief Returns the link-layer header type of the frames produced.
     */
    virtual int linkType() const = 0;

    /**
     * @brief Returns a human-readable name for the source (device or file).
     */
    virtual std::string name() const = 0;
};

} // namespace trafficpulse::core
