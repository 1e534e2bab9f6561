#include <catch2/catch.hpp>
#include "util/notification_center.hpp"
#include <vector>

using namespace flightcache;

TEST_CASE("NotificationCenter delivery", "[notifications]") {
    NotificationCenter center;
    auto owner = std::make_shared<int>(0);
    std::vector<LifecycleSignal> received;

    center.add_observer(LifecycleSignal::MemoryPressure, owner,
                        [&received](LifecycleSignal s) { received.push_back(s); });

    SECTION("Only matching signals are delivered") {
        REQUIRE(center.post(LifecycleSignal::EnteredBackground) == 0);
        REQUIRE(center.post(LifecycleSignal::MemoryPressure) == 1);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0] == LifecycleSignal::MemoryPressure);
    }

    SECTION("Observations lapse with their owner") {
        owner.reset();
        REQUIRE(center.observer_count() == 1);
        REQUIRE(center.post(LifecycleSignal::MemoryPressure) == 0);
        REQUIRE(center.observer_count() == 0);
        REQUIRE(received.empty());
    }

    SECTION("Removed observers are not called") {
        auto id = center.add_observer(LifecycleSignal::MemoryPressure, owner,
                                      [&received](LifecycleSignal s) { received.push_back(s); });
        REQUIRE(center.post(LifecycleSignal::MemoryPressure) == 2);
        center.remove_observer(id);
        center.remove_observer(id);
        REQUIRE(center.post(LifecycleSignal::MemoryPressure) == 1);
        REQUIRE(received.size() == 3);
    }
}

TEST_CASE("Signal names", "[notifications]") {
    REQUIRE(signal_to_string(LifecycleSignal::MemoryPressure) == "memory_pressure");
    REQUIRE(signal_to_string(LifecycleSignal::EnteredBackground) == "entered_background");
}
