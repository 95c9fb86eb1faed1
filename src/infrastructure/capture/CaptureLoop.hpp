#pragma once

#include "core/services/ICaptureSource.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/accounting/EgressResolver.hpp"
#include "infrastructure/accounting/TrafficAccumulator.hpp"
#include "infrastructure/capture/FrameDecoder.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace trafficpulse::infra {

/**
 * @brief Counters describing what the capture loop has seen.
 */
struct CaptureStatistics {
    uint64_t framesReceived{0};  ///< Frames read from the source
    uint64_t framesAccounted{0}; ///< Frames with at least one local side
    uint64_t framesSkipped{0};   ///< Non-Ethernet, non-IPv4 or malformed frames
    uint64_t captureErrors{0};   ///< Non-timeout read failures
};

/**
 * @brief Pulls frames from a capture source and attributes them to local endpoints.
 *
 * Runs on its own dedicated thread because reads block for up to the source's
 * timeout. Each frame whose source is local is recorded as transmit traffic of
 * the source; independently, each frame whose destination is local is recorded
 * as receive traffic of the destination.
 *
 * @note This class is non-copyable.
 */
class CaptureLoop {
public:
    /**
     * @brief Constructs a capture loop.
     * @param source Frame source; ownership is transferred.
     * @param subnets Local subnet set used for classification.
     * @param resolver Resolver used to pick the egress for a local endpoint.
     * @param accumulator Accumulator that receives the byte counts.
     */
    CaptureLoop(std::unique_ptr<core::ICaptureSource> source, const core::LocalSubnetSet& subnets,
                const EgressResolver& resolver, TrafficAccumulator& accumulator);

    /**
     * @brief Destructor. Stops the loop and joins its thread.
     */
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    /**
     * @brief Starts the capture thread. Has no effect if already running.
     */
    void start();

    /**
     * @brief Requests the loop to stop and joins the thread.
     *
     * The loop notices the request after its current read returns, which is
     * bounded by the source's read timeout.
     */
    void stop();

    /**
     * @brief Checks whether the capture thread is running.
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Classifies one decoded frame and records its contribution.
     * @param frame Decoded addresses and frame length.
     * @return True if at least one side of the frame was local.
     */
    bool processFrame(const DecodedFrame& frame);

    /**
     * @brief Handles one read result from the source.
     *
     * Frames are decoded and processed and timeouts are ignored. Errors are
     * counted; a run of consecutive errors is logged on its first occurrence
     * and then once every kErrorLogInterval errors.
     *
     * @param result The read outcome.
     * @return False once the source reports end of stream, true otherwise.
     */
    bool handleResult(const core::CaptureResult& result);

    /**
     * @brief Returns a copy of the current counters.
     */
    CaptureStatistics statistics() const;

    /// Pause after a failed read before the next attempt.
    static constexpr std::chrono::milliseconds kErrorBackoff{100};

    /// A run of consecutive errors is logged once per this many errors.
    static constexpr uint64_t kErrorLogInterval = 100;

private:
    void run();

    std::unique_ptr<core::ICaptureSource> source_;
    const core::LocalSubnetSet& subnets_;
    const EgressResolver& resolver_;
    TrafficAccumulator& accumulator_;
    bool ethernet_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    std::atomic<uint64_t> framesReceived_{0};
    std::atomic<uint64_t> framesAccounted_{0};
    std::atomic<uint64_t> framesSkipped_{0};
    std::atomic<uint64_t> captureErrors_{0};
    uint64_t consecutiveErrors_{0}; ///< Only touched by the capture thread
};

} // namespace trafficpulse::infra
