#include <catch2/catch_test_macros.hpp>

#include "infrastructure/accounting/EgressResolver.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace trafficpulse::core;
using namespace trafficpulse::infra;

namespace {

EgressMapping mappingWith(const std::string& endpoint, const std::string& tag) {
    EgressMapping mapping;
    mapping.mappings[endpoint] = tag;
    return mapping;
}

} // namespace

TEST_CASE("EgressResolver starts from the given mapping", "[EgressResolver]") {
    SECTION("Default construction uses built-in defaults") {
        EgressResolver resolver;
        CHECK(*resolver.current() == EgressMapping::defaults());
        CHECK(resolver.resolve("10.40.1.5") == "eth0");
    }

    SECTION("Initial mapping is honoured") {
        EgressResolver resolver(mappingWith("10.40.1.5", "wan1"));
        CHECK(resolver.resolve("10.40.1.5") == "eth1");
        CHECK(resolver.resolve("10.40.1.6") == "eth0");
    }
}

TEST_CASE("EgressResolver replacement", "[EgressResolver]") {
    EgressResolver resolver(mappingWith("10.40.1.5", "wan0"));

    SECTION("Replace switches subsequent lookups") {
        CHECK(resolver.resolve("10.40.1.5") == "eth0");
        resolver.replace(mappingWith("10.40.1.5", "wan1"));
        CHECK(resolver.resolve("10.40.1.5") == "eth1");
    }

    SECTION("Held snapshot is unaffected by replacement") {
        auto before = resolver.current();
        resolver.replace(mappingWith("10.40.1.5", "wan1"));

        CHECK(before->resolve("10.40.1.5") == "eth0");
        CHECK(resolver.current()->resolve("10.40.1.5") == "eth1");
        CHECK(before != resolver.current());
    }

    SECTION("Replacement also swaps interface names") {
        EgressMapping mapping;
        mapping.config = NicConfig{"lan9", "wanA", "wanB"};
        mapping.mappings["10.40.1.5"] = "wan1";
        resolver.replace(mapping);

        CHECK(resolver.resolve("10.40.1.5") == "wanB");
        CHECK(resolver.resolve("10.40.2.2") == "wanA");
    }
}

TEST_CASE("EgressResolver lookups during concurrent replacement", "[EgressResolver][Concurrency]") {
    EgressResolver resolver(mappingWith("10.40.1.5", "wan0"));
    std::atomic<bool> done{false};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                auto nic = resolver.resolve("10.40.1.5");
                if (nic != "eth0" && nic != "eth1") {
                    ++unexpected;
                }
            }
        });
    }

    for (int i = 0; i < 1000; ++i) {
        resolver.replace(mappingWith("10.40.1.5", i % 2 == 0 ? "wan1" : "wan0"));
    }
    done = true;

    for (auto& reader : readers) {
        reader.join();
    }

    CHECK(unexpected.load() == 0);
    CHECK(resolver.resolve("10.40.1.5") == "eth0");
}
