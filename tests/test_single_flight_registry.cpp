#include <catch2/catch.hpp>
#include "core/single_flight_registry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace flightcache;
using flightcache::testing::wait_for;

namespace {

using Registry = SingleFlightRegistry<std::string, int>;

struct Fixture {
    std::shared_ptr<ActivityTracker> tracker = std::make_shared<ActivityTracker>();
    DispatchQueue queue{"test.callbacks", tracker};
    WorkerPool pool{4, tracker};
    Registry registry{queue, pool};

    ~Fixture() {
        pool.shutdown();
        queue.shutdown();
    }
};

} // namespace

TEST_CASE("SingleFlightRegistry coalesces requests", "[single_flight]") {
    Fixture f;
    std::atomic<int> starts{0};
    std::atomic<bool> release{false};
    std::mutex mutex;
    std::vector<int> results;
    std::vector<RequestId> order;

    auto start = [&](Registry::Finish finish) {
        starts++;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finish(42);
    };

    std::vector<RequestId> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(f.registry.add_request("task", start, nullptr, nullptr, [&, i](const int& value) {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(value);
            order.push_back(static_cast<RequestId>(i));
        }));
    }

    REQUIRE(f.registry.task_count() == 1);
    REQUIRE(f.registry.request_count("task") == 5);

    release = true;
    f.tracker->wait_idle();

    SECTION("Work runs once and every request gets the result in request order") {
        REQUIRE(starts.load() == 1);
        REQUIRE(results == std::vector<int>{42, 42, 42, 42, 42});
        REQUIRE(order == std::vector<RequestId>{0, 1, 2, 3, 4});
        REQUIRE(f.registry.task_count() == 0);
    }

    SECTION("Request ids increase") {
        for (size_t i = 1; i < ids.size(); ++i) {
            REQUIRE(ids[i] > ids[i - 1]);
        }
    }
}

TEST_CASE("SingleFlightRegistry completion handler runs first", "[single_flight]") {
    Fixture f;
    std::vector<std::string> events;

    f.registry.add_request("task",
                           [](Registry::Finish finish) { finish(7); },
                           nullptr,
                           [&](const int& value) { events.push_back("done:" + std::to_string(value)); },
                           [&](const int& value) { events.push_back("request:" + std::to_string(value)); });
    f.tracker->wait_idle();

    REQUIRE(events == std::vector<std::string>{"done:7", "request:7"});
}

TEST_CASE("SingleFlightRegistry start is deferred past add_request", "[single_flight]") {
    Fixture f;
    std::atomic<bool> returned{false};
    std::atomic<bool> started_before_return{false};

    // add_request on the callback queue itself: start cannot run until this job ends
    f.queue.post([&]() {
        f.registry.add_request("task",
                               [&](Registry::Finish finish) {
                                   if (!returned.load()) started_before_return = true;
                                   finish(1);
                               },
                               nullptr, nullptr, nullptr);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        returned = true;
    });
    f.tracker->wait_idle();

    REQUIRE_FALSE(started_before_return.load());
}

TEST_CASE("SingleFlightRegistry cancellation", "[single_flight]") {
    Fixture f;
    std::atomic<int> cancels{0};
    std::atomic<int> deliveries{0};
    std::atomic<bool> release{false};

    auto start = [&](Registry::Finish finish) {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finish(5);
    };
    auto cancel = [&]() { cancels++; };
    auto deliver = [&](const int&) { deliveries++; };

    RequestId a = f.registry.add_request("task", start, cancel, nullptr, deliver);
    RequestId b = f.registry.add_request("task", start, cancel, nullptr, deliver);
    RequestId c = f.registry.add_request("task", start, cancel, nullptr, deliver);

    SECTION("Cancelling some requests leaves the rest attached") {
        f.registry.cancel_request(a);
        f.registry.cancel_request(b);
        REQUIRE(cancels.load() == 0);
        REQUIRE(f.registry.request_count("task") == 1);

        release = true;
        f.tracker->wait_idle();
        REQUIRE(deliveries.load() == 1);
    }

    SECTION("Cancelling every request cancels the task exactly once") {
        f.registry.cancel_request(a);
        f.registry.cancel_request(b);
        f.registry.cancel_request(c);
        f.registry.cancel_request(c);
        REQUIRE(cancels.load() == 1);
        REQUIRE(f.registry.task_count() == 0);

        release = true;
        f.tracker->wait_idle();
        REQUIRE(deliveries.load() == 0);
    }

    SECTION("Unknown ids are ignored") {
        f.registry.cancel_request(999999999);
        REQUIRE(f.registry.request_count("task") == 3);
        release = true;
        f.tracker->wait_idle();
        REQUIRE(deliveries.load() == 3);
    }
}

TEST_CASE("SingleFlightRegistry ignores a stale finish", "[single_flight]") {
    Fixture f;
    std::atomic<bool> release_first{false};
    std::atomic<int> deliveries{0};
    std::atomic<int> last_value{0};

    RequestId first = f.registry.add_request("task",
        [&](Registry::Finish finish) {
            while (!release_first.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finish(1);
        },
        nullptr, nullptr, [&](const int&) { deliveries++; });

    // Let the first task start, then abandon it
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    f.registry.cancel_request(first);

    std::atomic<bool> release_second{false};
    f.registry.add_request("task",
        [&](Registry::Finish finish) {
            while (!release_second.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finish(2);
        },
        nullptr, nullptr, [&](const int& value) { deliveries++; last_value = value; });

    release_first = true;
    REQUIRE(wait_for([&]() { return f.registry.task_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(deliveries.load() == 0);

    release_second = true;
    f.tracker->wait_idle();
    REQUIRE(deliveries.load() == 1);
    REQUIRE(last_value.load() == 2);
}

TEST_CASE("SingleFlightRegistry tasks are independent", "[single_flight]") {
    Fixture f;
    std::atomic<int> starts{0};
    std::mutex mutex;
    std::map<std::string, int> results;

    for (const std::string id : {"a", "b", "c"}) {
        f.registry.add_request(id,
                               [&, id](Registry::Finish finish) {
                                   starts++;
                                   finish(static_cast<int>(id[0]));
                               },
                               nullptr, nullptr,
                               [&, id](const int& value) {
                                   std::lock_guard<std::mutex> lock(mutex);
                                   results[id] = value;
                               });
    }
    f.tracker->wait_idle();

    REQUIRE(starts.load() == 3);
    REQUIRE(results.size() == 3);
    REQUIRE(results["b"] == 'b');
}

TEST_CASE("SingleFlightRegistry survives a throwing start", "[single_flight][errors]") {
    Fixture f;
    std::mutex mutex;
    std::vector<int> results;
    auto collect = [&](const int& value) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(value);
    };

    auto throwing = [](Registry::Finish) { throw std::runtime_error("collaborator failed"); };
    f.registry.add_request("task", throwing, nullptr, nullptr, collect);
    f.registry.add_request("task", throwing, nullptr, nullptr, collect);
    f.tracker->wait_idle();

    REQUIRE(results == std::vector<int>{0, 0});
    REQUIRE_FALSE(f.registry.has_task("task"));

    std::atomic<int> starts{0};
    f.registry.add_request("task",
                           [&](Registry::Finish finish) {
                               starts++;
                               finish(42);
                           },
                           nullptr, nullptr, collect);
    f.tracker->wait_idle();

    REQUIRE(starts.load() == 1);
    REQUIRE(results == std::vector<int>{0, 0, 42});
}

TEST_CASE("SingleFlightRegistry isolates throwing callbacks", "[single_flight][errors]") {
    Fixture f;
    std::atomic<int> delivered{0};
    std::atomic<bool> release{false};

    auto start = [&](Registry::Finish finish) {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finish(3);
    };

    f.registry.add_request("task", start, nullptr,
                           [](const int&) { throw std::runtime_error("completion handler failed"); },
                           [](const int&) { throw std::runtime_error("first caller failed"); });
    f.registry.add_request("task", start, nullptr, nullptr, [&](const int&) { delivered++; });
    f.registry.add_request("task", start, nullptr, nullptr, [&](const int&) { delivered++; });

    release = true;
    f.tracker->wait_idle();

    REQUIRE(delivered.load() == 2);
    REQUIRE(f.registry.task_count() == 0);
}

TEST_CASE("SingleFlightRegistry delivers on the callback queue", "[single_flight][threading]") {
    Fixture f;
    std::mutex mutex;
    std::vector<std::thread::id> threads;
    auto record = [&](const int&) {
        std::lock_guard<std::mutex> lock(mutex);
        threads.push_back(std::this_thread::get_id());
    };

    for (const std::string id : {"a", "b"}) {
        for (int i = 0; i < 3; ++i) {
            f.registry.add_request(id, [](Registry::Finish finish) { finish(1); }, nullptr, record, record);
        }
    }
    f.tracker->wait_idle();

    // One completion handler per task plus one callback per request
    REQUIRE(threads.size() == 8);
    for (const auto& id : threads) {
        REQUIRE(id == f.queue.thread_id());
    }
}

TEST_CASE("SingleFlightRegistry concurrent cancellation", "[single_flight][cancel]") {
    Fixture f;
    std::atomic<int> cancels{0};
    std::atomic<bool> release{false};
    auto start = [&](Registry::Finish finish) {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finish(1);
    };

    std::vector<RequestId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(f.registry.add_request("task", start, [&]() { cancels++; }, nullptr, nullptr));
    }

    // Every thread cancels every request, racing on the same ids
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (RequestId id : ids) {
                f.registry.cancel_request(id);
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(cancels.load() == 1);
    REQUIRE(f.registry.task_count() == 0);
    REQUIRE(f.registry.request_count("task") == 0);

    release = true;
    f.tracker->wait_idle();
}
