#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/types/Subnet.hpp"
#include "infrastructure/accounting/EgressResolver.hpp"
#include "infrastructure/accounting/TrafficAccumulator.hpp"
#include "infrastructure/capture/FrameDecoder.hpp"
#include "infrastructure/metrics/MetricsRegistry.hpp"

#include <string>
#include <vector>

using namespace trafficpulse::core;
using namespace trafficpulse::infra;

// =============================================================================
// Per-frame hot path
// =============================================================================

TEST_CASE("Frame path benchmarks", "[benchmark][Capture]") {
    std::vector<uint8_t> frame(1514, 0);
    frame[12] = 0x08;
    frame[14] = 0x45;
    frame[26] = 10;
    frame[27] = 40;
    frame[28] = 1;
    frame[29] = 5;
    frame[30] = 8;
    frame[31] = 8;
    frame[32] = 8;
    frame[33] = 8;

    LocalSubnetSet subnets;
    subnets.addSubnet("10.40.0.0/20");

    EgressMapping mapping;
    for (int i = 0; i < 256; ++i) {
        mapping.mappings["10.40.1." + std::to_string(i)] = i % 2 == 0 ? "wan0" : "wan1";
    }
    EgressResolver resolver(mapping);

    BENCHMARK("FrameDecoder::decodeEthernet") {
        return FrameDecoder::decodeEthernet(frame.data(), frame.size(), frame.size());
    };

    BENCHMARK("LocalSubnetSet::isLocal numeric") {
        return subnets.isLocal(0x0A280105u);
    };

    BENCHMARK("formatIpv4") {
        return formatIpv4(0x0A280105u);
    };

    BENCHMARK("EgressResolver::resolve") {
        return resolver.resolve("10.40.1.5");
    };
}

TEST_CASE("Accumulator benchmarks", "[benchmark][TrafficAccumulator]") {
    TrafficAccumulator accumulator;

    BENCHMARK("TrafficAccumulator::record existing key") {
        accumulator.record(TrafficDirection::Transmit, "eth0", "10.40.1.5", 1500);
    };

    BENCHMARK("TrafficAccumulator::record and drain 256 endpoints") {
        for (int i = 0; i < 256; ++i) {
            accumulator.record(TrafficDirection::Receive, "eth1", "10.40.1." + std::to_string(i),
                               1500);
        }
        return accumulator.drainAndReset();
    };
}

TEST_CASE("Exposition benchmarks", "[benchmark][MetricsRegistry]") {
    MetricsRegistry registry;
    auto gauge = registry.registerGauge("network_ip_tx_bps", "TX", {"local_ip", "nic"});
    for (int i = 0; i < 1024; ++i) {
        gauge->set({"10.40." + std::to_string(i / 256) + "." + std::to_string(i % 256), "eth0"},
                   12000.0);
    }

    BENCHMARK("MetricsRegistry::serialize 1024 series") {
        return registry.serialize();
    };
}
