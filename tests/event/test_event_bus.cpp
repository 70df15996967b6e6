/// @file test_event_bus.cpp
/// @brief Tests for EventBus

#include <catch2/catch_test_macros.hpp>
#include <sker/event/event_bus.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sker_event;
using namespace std::chrono_literals;

// Test event types
struct TestEvent {
    int value;
};

struct OtherEvent {
    std::string message;
};

TEST_CASE("EventBus: creation", "[event][bus]") {
    EventBus bus("test");
    REQUIRE(bus.name() == "test");
    REQUIRE(bus.event_names().empty());
    REQUIRE(bus.max_listeners() == EventBus::DEFAULT_MAX_LISTENERS);
}

TEST_CASE("EventBus: emit delivers in registration order", "[event][bus]") {
    EventBus bus;
    std::vector<int> order;

    for (int i = 1; i <= 3; ++i) {
        auto id = bus.on("tick", [&order, i](const std::any&) { order.push_back(i); });
        REQUIRE(id.is_ok());
    }

    bus.emit("tick");
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(bus.listener_count("tick") == 3);
}

TEST_CASE("EventBus: typed listeners", "[event][bus]") {
    EventBus bus;
    int received = 0;
    int others = 0;

    REQUIRE(bus.on<TestEvent>("data", [&received](const TestEvent& e) { received = e.value; }).is_ok());
    REQUIRE(bus.on<OtherEvent>("data", [&others](const OtherEvent&) { ++others; }).is_ok());

    bus.emit("data", TestEvent{42});
    REQUIRE(received == 42);
    REQUIRE(others == 0);
}

TEST_CASE("EventBus: once fires a single time", "[event][bus]") {
    EventBus bus;
    int count = 0;

    REQUIRE(bus.once("ready", [&count](const std::any&) { ++count; }).is_ok());
    REQUIRE(bus.listener_count("ready") == 1);

    bus.emit("ready");
    bus.emit("ready");
    REQUIRE(count == 1);
    REQUIRE(bus.listener_count("ready") == 0);
}

TEST_CASE("EventBus: off", "[event][bus]") {
    EventBus bus;
    int a = 0;
    int b = 0;

    auto first = bus.on("x", [&a](const std::any&) { ++a; });
    auto second = bus.on("x", [&b](const std::any&) { ++b; });
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    SECTION("one listener") {
        bus.off("x", first.value());
        bus.emit("x");
        REQUIRE(a == 0);
        REQUIRE(b == 1);
    }

    SECTION("all listeners of an event") {
        bus.off("x");
        bus.emit("x");
        REQUIRE(a + b == 0);
        REQUIRE(bus.listener_count("x") == 0);
    }

    SECTION("remove_all_listeners") {
        REQUIRE(bus.on("y", [](const std::any&) {}).is_ok());
        bus.remove_all_listeners();
        REQUIRE(bus.event_names().empty());
    }
}

TEST_CASE("EventBus: listener removed during delivery is skipped", "[event][bus]") {
    EventBus bus;
    int second_calls = 0;
    ListenerId second_id;

    REQUIRE(bus.on("e", [&bus, &second_id](const std::any&) { bus.off("e", second_id); }).is_ok());
    auto second = bus.on("e", [&second_calls](const std::any&) { ++second_calls; });
    REQUIRE(second.is_ok());
    second_id = second.value();

    bus.emit("e");
    REQUIRE(second_calls == 0);
}

TEST_CASE("EventBus: failure isolation", "[event][bus]") {
    EventBus bus;
    int after = 0;
    std::vector<ErrorEvent> errors;

    REQUIRE(bus.on(events::GENERIC_ERROR, [&errors](const std::any& payload) {
        errors.push_back(std::any_cast<ErrorEvent>(payload));
    }).is_ok());
    REQUIRE(bus.on("work", [](const std::any&) { throw std::runtime_error("listener broke"); }).is_ok());
    REQUIRE(bus.on("work", [&after](const std::any&) { ++after; }).is_ok());

    bus.emit("work");

    REQUIRE(after == 1);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].event == "work");
    REQUIRE(errors[0].error.message() == "listener broke");
    REQUIRE(errors[0].error.code() == sker_core::ErrorCode::EventFailed);
}

TEST_CASE("EventBus: failing ERROR listener does not recurse", "[event][bus]") {
    EventBus bus;
    int calls = 0;

    REQUIRE(bus.on(events::GENERIC_ERROR, [&calls](const std::any&) {
        ++calls;
        throw std::runtime_error("error handler broke");
    }).is_ok());
    REQUIRE(bus.on("work", [](const std::any&) { throw std::runtime_error("first"); }).is_ok());

    bus.emit("work");
    REQUIRE(calls == 1);
}

TEST_CASE("EventBus: registration errors", "[event][bus]") {
    EventBus bus;

    auto empty_name = bus.on("", [](const std::any&) {});
    REQUIRE(empty_name.is_err());
    REQUIRE(empty_name.error().code() == sker_core::ErrorCode::InvalidArgument);

    auto empty_handler = bus.on("x", Handler{});
    REQUIRE(empty_handler.is_err());
}

TEST_CASE("EventBus: max listeners only warns", "[event][bus]") {
    EventBus bus;
    bus.set_max_listeners(2);
    REQUIRE(bus.max_listeners() == 2);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(bus.on("busy", [](const std::any&) {}).is_ok());
    }
    REQUIRE(bus.listener_count("busy") == 4);

    bus.set_max_listeners(0);
    REQUIRE(bus.on("busy", [](const std::any&) {}).is_ok());
}

TEST_CASE("EventBus: emit_async awaits each listener in order", "[event][bus]") {
    EventBus bus;
    std::vector<std::string> order;
    std::mutex mutex;

    REQUIRE(bus.on_async("job", [&order, &mutex](const std::any&) {
        return std::async(std::launch::async, [&order, &mutex]() {
            std::this_thread::sleep_for(20ms);
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back("slow");
        });
    }).is_ok());
    REQUIRE(bus.on("job", [&order, &mutex](const std::any&) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("sync");
    }).is_ok());

    auto result = bus.emit_async("job");
    REQUIRE(result.is_ok());
    REQUIRE(order == std::vector<std::string>{"slow", "sync"});
}

TEST_CASE("EventBus: emit_async reports failures after running everyone", "[event][bus]") {
    EventBus bus;
    int ran = 0;
    int errors = 0;

    REQUIRE(bus.on(events::GENERIC_ERROR, [&errors](const std::any&) { ++errors; }).is_ok());
    REQUIRE(bus.on_async("job", [](const std::any&) {
        return std::async(std::launch::async, []() { throw std::runtime_error("async broke"); });
    }).is_ok());
    REQUIRE(bus.on("job", [&ran](const std::any&) { ++ran; }).is_ok());

    auto result = bus.emit_async("job");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == sker_core::ErrorCode::EventFailed);
    REQUIRE(result.error().children().size() == 1);
    REQUIRE(ran == 1);
    REQUIRE(errors == 1);
}

TEST_CASE("EventBus: emit does not await async listeners", "[event][bus]") {
    EventBus bus;
    std::atomic<bool> done{false};
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    REQUIRE(bus.on_async("job", [&done, opened](const std::any&) {
        return std::async(std::launch::async, [&done, opened]() {
            opened.wait();
            done.store(true);
        });
    }).is_ok());

    bus.emit("job");
    REQUIRE_FALSE(done.load());

    gate.set_value();
    bus.wait_for_pending();
    REQUIRE(done.load());
}

TEST_CASE("EventBus: catch-all listeners", "[event][bus]") {
    EventBus bus;
    std::vector<std::string> seen;

    ListenerId id = bus.on_any([&seen](const std::string& event, const std::any&) { seen.push_back(event); });
    bus.emit("a");
    bus.emit("b");
    bus.off_any(id);
    bus.emit("c");

    REQUIRE(seen == std::vector<std::string>{"a", "b"});
}

TEST_CASE("EventBus: concurrent emit and subscribe", "[event][bus]") {
    EventBus bus;
    bus.set_max_listeners(0);
    std::atomic<int> received{0};

    REQUIRE(bus.on("hit", [&received](const std::any&) { received.fetch_add(1); }).is_ok());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bus]() {
            for (int i = 0; i < 100; ++i) {
                bus.emit("hit");
            }
        });
    }
    threads.emplace_back([&bus]() {
        for (int i = 0; i < 50; ++i) {
            auto id = bus.on("other", [](const std::any&) {});
            if (id) {
                bus.off("other", id.value());
            }
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(received.load() == 400);
}
