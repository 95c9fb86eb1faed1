#include "infrastructure/capture/CaptureLoop.hpp"

#include <spdlog/spdlog.h>

namespace trafficpulse::infra {

CaptureLoop::CaptureLoop(std::unique_ptr<core::ICaptureSource> source,
                         const core::LocalSubnetSet& subnets, const EgressResolver& resolver,
                         TrafficAccumulator& accumulator)
    : source_(std::move(source)), subnets_(subnets), resolver_(resolver),
      accumulator_(accumulator),
      ethernet_(source_->linkType() == core::ICaptureSource::kLinkTypeEthernet) {
    if (!ethernet_) {
        spdlog::warn("Capture source {} has link type {}, frames will not be accounted",
                     source_->name(), source_->linkType());
    }
}

CaptureLoop::~CaptureLoop() {
    stop();
}

void CaptureLoop::start() {
    if (running_.exchange(true)) {
        return;
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    stopRequested_ = false;
    thread_ = std::thread([this]() { run(); });
    spdlog::info("Started capturing on {}", source_->name());
}

void CaptureLoop::stop() {
    stopRequested_ = true;

    if (thread_.joinable()) {
        thread_.join();
    }
}

void CaptureLoop::run() {
    while (!stopRequested_.load()) {
        auto result = source_->next();
        if (!handleResult(result)) {
            spdlog::info("Capture source {} exhausted", source_->name());
            break;
        }
        if (result.status == core::CaptureStatus::Error) {
            std::this_thread::sleep_for(kErrorBackoff);
        }
    }

    running_ = false;
    spdlog::info("Stopped capturing on {}", source_->name());
}

bool CaptureLoop::handleResult(const core::CaptureResult& result) {
    if (result.status != core::CaptureStatus::Error && consecutiveErrors_ > 0) {
        spdlog::info("Capture on {} recovered after {} errors", source_->name(),
                     consecutiveErrors_);
        consecutiveErrors_ = 0;
    }

    switch (result.status) {
    case core::CaptureStatus::Frame: {
        ++framesReceived_;

        std::optional<DecodedFrame> frame;
        if (ethernet_) {
            frame = FrameDecoder::decodeEthernet(result.data, result.capturedLength,
                                                 result.frameLength);
        }

        if (!frame) {
            ++framesSkipped_;
        } else if (processFrame(*frame)) {
            ++framesAccounted_;
        }
        return true;
    }
    case core::CaptureStatus::Timeout:
        return true;
    case core::CaptureStatus::Error:
        ++captureErrors_;
        ++consecutiveErrors_;
        if (consecutiveErrors_ == 1 || consecutiveErrors_ % kErrorLogInterval == 0) {
            spdlog::error("Error capturing packet: {} ({} in a row)", result.errorMessage,
                          consecutiveErrors_);
        }
        return true;
    case core::CaptureStatus::EndOfStream:
        return false;
    }
    return true;
}

bool CaptureLoop::processFrame(const DecodedFrame& frame) {
    bool accounted = false;

    if (subnets_.isLocal(frame.sourceAddress)) {
        auto endpoint = core::formatIpv4(frame.sourceAddress);
        auto nic = resolver_.resolve(endpoint);
        accumulator_.record(core::TrafficDirection::Transmit, nic, endpoint, frame.frameLength);
        accounted = true;
    }

    if (subnets_.isLocal(frame.destinationAddress)) {
        auto endpoint = core::formatIpv4(frame.destinationAddress);
        auto nic = resolver_.resolve(endpoint);
        accumulator_.record(core::TrafficDirection::Receive, nic, endpoint, frame.frameLength);
        accounted = true;
    }

    return accounted;
}

CaptureStatistics CaptureLoop::statistics() const {
    CaptureStatistics stats;
    stats.framesReceived = framesReceived_.load();
    stats.framesAccounted = framesAccounted_.load();
    stats.framesSkipped = framesSkipped_.load();
    stats.captureErrors = captureErrors_.load();
    return stats;
}

} // namespace trafficpulse::infra
