#include <catch2/catch_test_macros.hpp>

#include "core/types/EgressMapping.hpp"

using namespace trafficpulse::core;

TEST_CASE("EgressMapping defaults", "[EgressMapping]") {
    auto mapping = EgressMapping::defaults();

    CHECK(mapping.config.lan == "eth2");
    CHECK(mapping.config.wan0 == "eth0");
    CHECK(mapping.config.wan1 == "eth1");
    CHECK(mapping.mappings.empty());
}

TEST_CASE("EgressMapping resolution", "[EgressMapping]") {
    EgressMapping mapping;
    mapping.config = NicConfig{"lan0", "ppp0", "ppp1"};
    mapping.mappings = {
        {"10.40.1.5", "wan1"},
        {"10.40.1.6", "wan0"},
        {"10.40.1.7", "wan2"},
        {"10.40.1.8", ""},
    };

    SECTION("Secondary tag resolves to wan1 interface") {
        CHECK(mapping.resolve("10.40.1.5") == "ppp1");
    }

    SECTION("Primary tag resolves to wan0 interface") {
        CHECK(mapping.resolve("10.40.1.6") == "ppp0");
    }

    SECTION("Unknown tags fall back to wan0 interface") {
        CHECK(mapping.resolve("10.40.1.7") == "ppp0");
        CHECK(mapping.resolve("10.40.1.8") == "ppp0");
    }

    SECTION("Unmapped endpoint falls back to wan0 interface") {
        CHECK(mapping.resolve("10.40.9.9") == "ppp0");
    }

    SECTION("Tag comparison is case sensitive") {
        mapping.mappings["10.40.1.9"] = "WAN1";
        CHECK(mapping.resolve("10.40.1.9") == "ppp0");
    }
}
