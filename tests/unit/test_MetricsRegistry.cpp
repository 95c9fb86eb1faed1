#include <catch2/catch_test_macros.hpp>

#include "infrastructure/metrics/MetricsRegistry.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace trafficpulse::infra;

TEST_CASE("MetricFamily stores last value per label set", "[MetricsRegistry]") {
    MetricFamily family("network_ip_tx_bps", "Transmit rate", {"local_ip", "nic"});

    SECTION("Set and read back") {
        family.set({"10.40.1.5", "eth0"}, 12000.0);
        CHECK(family.value({"10.40.1.5", "eth0"}) == 12000.0);
        CHECK(family.size() == 1);
    }

    SECTION("Later value replaces earlier value") {
        family.set({"10.40.1.5", "eth0"}, 12000.0);
        family.set({"10.40.1.5", "eth0"}, 800.0);
        CHECK(family.value({"10.40.1.5", "eth0"}) == 800.0);
        CHECK(family.size() == 1);
    }

    SECTION("Unknown label set has no value") {
        CHECK_FALSE(family.value({"10.40.1.6", "eth0"}).has_value());
    }

    SECTION("Wrong number of label values throws") {
        CHECK_THROWS_AS(family.set({"10.40.1.5"}, 1.0), std::invalid_argument);
        CHECK_THROWS_AS(family.set({"a", "b", "c"}, 1.0), std::invalid_argument);
        CHECK(family.size() == 0);
    }
}

TEST_CASE("MetricFamily text exposition", "[MetricsRegistry]") {
    SECTION("Empty family writes nothing") {
        MetricFamily family("empty_metric", "Nothing here", {"nic"});
        std::string out;
        family.serialize(out);
        CHECK(out.empty());
    }

    SECTION("Labelled gauge") {
        MetricFamily family("network_ip_tx_bps_total", "Transmit rate per NIC", {"nic"});
        family.set({"eth0"}, 12000.0);

        std::string out;
        family.serialize(out);
        CHECK(out == "# HELP network_ip_tx_bps_total Transmit rate per NIC\n"
                     "# TYPE network_ip_tx_bps_total gauge\n"
                     "network_ip_tx_bps_total{nic=\"eth0\"} 12000\n");
    }

    SECTION("Unlabelled gauge") {
        MetricFamily family("trafficpulse_capture_errors_total", "Capture errors", {});
        family.set({}, 3.0);

        std::string out;
        family.serialize(out);
        CHECK(out.find("trafficpulse_capture_errors_total 3\n") != std::string::npos);
    }

    SECTION("Counter family declares counter type") {
        MetricFamily family("trafficpulse_capture_errors_total", "Capture errors", {},
                            MetricType::Counter);
        family.set({}, 7.0);

        std::string out;
        family.serialize(out);
        CHECK(out == "# HELP trafficpulse_capture_errors_total Capture errors\n"
                     "# TYPE trafficpulse_capture_errors_total counter\n"
                     "trafficpulse_capture_errors_total 7\n");
    }

    SECTION("Label values are escaped") {
        MetricFamily family("escaped", "Escaping", {"name"});
        family.set({"a\"b\\c\nd"}, 1.0);

        std::string out;
        family.serialize(out);
        CHECK(out.find("escaped{name=\"a\\\"b\\\\c\\nd\"} 1\n") != std::string::npos);
    }

    SECTION("Fractional and special values") {
        MetricFamily family("values", "Values", {"kind"});
        family.set({"fraction"}, 0.5);
        family.set({"nan"}, std::numeric_limits<double>::quiet_NaN());
        family.set({"pinf"}, std::numeric_limits<double>::infinity());
        family.set({"ninf"}, -std::numeric_limits<double>::infinity());

        std::string out;
        family.serialize(out);
        CHECK(out.find("values{kind=\"fraction\"} 0.5\n") != std::string::npos);
        CHECK(out.find("values{kind=\"nan\"} NaN\n") != std::string::npos);
        CHECK(out.find("values{kind=\"pinf\"} +Inf\n") != std::string::npos);
        CHECK(out.find("values{kind=\"ninf\"} -Inf\n") != std::string::npos);
    }
}

TEST_CASE("MetricsRegistry registration", "[MetricsRegistry]") {
    MetricsRegistry registry;

    SECTION("Registered family can be found") {
        auto family = registry.registerGauge("network_ip_rx_bps", "Receive rate",
                                             {"local_ip", "nic"});
        CHECK(registry.find("network_ip_rx_bps") == family);
        CHECK(registry.find("missing") == nullptr);
    }

    SECTION("Counters and gauges share one namespace") {
        auto counter = registry.registerCounter("frames_total", "Frames", {"result"});
        CHECK(counter->type() == MetricType::Counter);
        CHECK(registry.registerGauge("frames_rate", "Rate")->type() == MetricType::Gauge);
        CHECK_THROWS_AS(registry.registerGauge("frames_total", "Again"), std::invalid_argument);
    }

    SECTION("Duplicate names are rejected") {
        registry.registerGauge("network_ip_rx_bps", "Receive rate", {"local_ip", "nic"});
        CHECK_THROWS_AS(registry.registerGauge("network_ip_rx_bps", "Again", {}),
                        std::invalid_argument);
    }

    SECTION("Invalid metric and label names are rejected") {
        CHECK_THROWS_AS(registry.registerGauge("", "Empty"), std::invalid_argument);
        CHECK_THROWS_AS(registry.registerGauge("9lives", "Leading digit"), std::invalid_argument);
        CHECK_THROWS_AS(registry.registerGauge("has-dash", "Dash"), std::invalid_argument);
        CHECK_THROWS_AS(registry.registerGauge("ok_name", "Bad label", {"local-ip"}),
                        std::invalid_argument);
        CHECK_THROWS_AS(registry.registerGauge("ok_name", "Colon label", {"a:b"}),
                        std::invalid_argument);
        CHECK(registry.find("ok_name") == nullptr);
    }
}

TEST_CASE("MetricsRegistry serializes families in registration order", "[MetricsRegistry]") {
    MetricsRegistry registry;
    auto second = registry.registerGauge("b_metric", "Second", {"nic"});
    auto first = registry.registerGauge("a_metric", "First", {"nic"});
    registry.registerGauge("c_metric", "Unset", {"nic"});

    second->set({"eth0"}, 1.0);
    first->set({"eth1"}, 2.0);

    auto text = registry.serialize();
    auto bPos = text.find("# HELP b_metric");
    auto aPos = text.find("# HELP a_metric");
    REQUIRE(bPos != std::string::npos);
    REQUIRE(aPos != std::string::npos);
    CHECK(bPos < aPos);
    CHECK(text.find("c_metric") == std::string::npos);
    CHECK(text.back() == '\n');
}
