#include "infrastructure/capture/PcapCaptureSource.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace trafficpulse::infra {

PcapCaptureSource::PcapCaptureSource(PcapHandle handle, std::string name)
    : handle_(std::move(handle)), name_(std::move(name)) {}

std::vector<std::string> PcapCaptureSource::listDevices() {
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_if_t* devices = nullptr;

    if (pcap_findalldevs(&devices, errbuf) == PCAP_ERROR) {
        throw std::runtime_error(std::string("Failed to list devices: ") + errbuf);
    }

    std::vector<std::string> names;
    for (pcap_if_t* dev = devices; dev != nullptr; dev = dev->next) {
        names.emplace_back(dev->name);
    }
    pcap_freealldevs(devices);

    return names;
}

std::unique_ptr<PcapCaptureSource> PcapCaptureSource::openLive(const std::string& device,
                                                               const CaptureOptions& options) {
    auto devices = listDevices();
    if (std::find(devices.begin(), devices.end(), device) == devices.end()) {
        throw std::runtime_error("Device " + device + " not found");
    }

    char errbuf[PCAP_ERRBUF_SIZE];
    PcapHandle handle(pcap_create(device.c_str(), errbuf), &pcap_close);
    if (!handle) {
        throw std::runtime_error("Failed to open device " + device + ": " + errbuf);
    }

    pcap_set_promisc(handle.get(), options.promiscuous ? 1 : 0);
    pcap_set_snaplen(handle.get(), options.snaplen);
    pcap_set_timeout(handle.get(), options.timeoutMs);

    int status = pcap_activate(handle.get());
    if (status < 0) {
        throw std::runtime_error("Failed to activate capture on " + device + ": " +
                                 pcap_geterr(handle.get()));
    }
    if (status > 0) {
        spdlog::warn("Capture on {} activated with warning: {}", device,
                     pcap_geterr(handle.get()));
    }

    spdlog::debug("Opened {} (promisc={}, snaplen={}, timeout={}ms)", device,
                  options.promiscuous, options.snaplen, options.timeoutMs);

    return std::unique_ptr<PcapCaptureSource>(new PcapCaptureSource(std::move(handle), device));
}

std::unique_ptr<PcapCaptureSource> PcapCaptureSource::openOffline(const std::string& path) {
    char errbuf[PCAP_ERRBUF_SIZE];
    PcapHandle handle(pcap_open_offline(path.c_str(), errbuf), &pcap_close);
    if (!handle) {
        throw std::runtime_error("Failed to open capture file " + path + ": " + errbuf);
    }

    return std::unique_ptr<PcapCaptureSource>(new PcapCaptureSource(std::move(handle), path));
}

core::CaptureResult PcapCaptureSource::next() {
    core::CaptureResult result;

    struct pcap_pkthdr* header = nullptr;
    const u_char* data = nullptr;

    switch (pcap_next_ex(handle_.get(), &header, &data)) {
    case 1:
        result.status = core::CaptureStatus::Frame;
        result.data = data;
        result.capturedLength = header->caplen;
        result.frameLength = header->len;
        break;
    case 0:
        result.status = core::CaptureStatus::Timeout;
        break;
    case PCAP_ERROR_BREAK:
        result.status = core::CaptureStatus::EndOfStream;
        break;
    default:
        result.status = core::CaptureStatus::Error;
        result.errorMessage = pcap_geterr(handle_.get());
        break;
    }

    return result;
}

int PcapCaptureSource::linkType() const {
    return pcap_datalink(handle_.get());
}

} // namespace trafficpulse::infra
