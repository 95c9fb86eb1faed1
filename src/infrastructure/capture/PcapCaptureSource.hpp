#pragma once

#include "core/services/ICaptureSource.hpp"

#include <pcap.h>

#include <memory>
#include <string>
#include <vector>

namespace trafficpulse::infra {

/**
 * @brief Settings for opening a live capture device.
 */
struct CaptureOptions {
    int snaplen{65535};      ///< Maximum bytes captured per frame.
    int timeoutMs{1000};     ///< Read timeout in milliseconds.
    bool promiscuous{true};  ///< Capture frames not addressed to this host.
};

/**
 * @brief Capture source backed by libpcap.
 *
 * Wraps a live device handle or an offline savefile. Construction goes through
 * the static open functions, which throw on failure.
 *
 * @note This class is non-copyable.
 */
class PcapCaptureSource : public core::ICaptureSource {
public:
    ~PcapCaptureSource() override = default;

    PcapCaptureSource(const PcapCaptureSource&) = delete;
    PcapCaptureSource& operator=(const PcapCaptureSource&) = delete;

    /**
     * @brief Lists the names of all capture devices.
     * @return Device names as reported by pcap_findalldevs().
     * @throws std::runtime_error if the devices cannot be enumerated.
     */
    static std::vector<std::string> listDevices();

    /**
     * @brief Opens and activates a live capture device.
     * @param device Interface name (e.g., "eth2").
     * @param options Snap length, timeout and promiscuous mode.
     * @return The activated source.
     * @throws std::runtime_error if the device does not exist or cannot be activated.
     */
    static std::unique_ptr<PcapCaptureSource> openLive(const std::string& device,
                                                       const CaptureOptions& options);

    /**
     * @brief Opens a savefile for offline replay.
     * @param path Path to a pcap file.
     * @return The opened source.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static std::unique_ptr<PcapCaptureSource> openOffline(const std::string& path);

    core::CaptureResult next() override;
    int linkType() const override;
    std::string name() const override { return name_; }

private:
    using PcapHandle = std::unique_ptr<pcap_t, decltype(&pcap_close)>;

    PcapCaptureSource(PcapHandle handle, std::string name);

    PcapHandle handle_;
    std::string name_;
};

} // namespace trafficpulse::infra
