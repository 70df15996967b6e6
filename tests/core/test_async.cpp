// sker_core cancellation and timeout race tests

#include <catch2/catch_test_macros.hpp>
#include <sker/core/async.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace sker_core;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken", "[core][async]") {
    SECTION("copies share state") {
        CancellationToken token;
        CancellationToken copy = token;
        REQUIRE_FALSE(copy.is_cancelled());

        token.cancel();
        REQUIRE(copy.is_cancelled());
    }

    SECTION("cancel through a const reference") {
        CancellationToken token;
        const CancellationToken& view = token;
        view.cancel();
        REQUIRE(token.is_cancelled());
    }

    SECTION("wait_for returns false on expiry") {
        CancellationToken token;
        REQUIRE_FALSE(token.wait_for(5ms));
    }

    SECTION("wait_for wakes on cancel") {
        CancellationToken token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(10ms);
            token.cancel();
        });

        auto started = std::chrono::steady_clock::now();
        REQUIRE(token.wait_for(5s));
        REQUIRE(std::chrono::steady_clock::now() - started < 2s);
        canceller.join();
    }
}

TEST_CASE("BackgroundTasks joins outstanding work", "[core][async]") {
    std::atomic<int> finished{0};
    {
        BackgroundTasks tasks;
        for (int i = 0; i < 3; ++i) {
            tasks.spawn([&finished]() {
                std::this_thread::sleep_for(5ms);
                finished.fetch_add(1);
            });
        }
    }
    REQUIRE(finished.load() == 3);
}

TEST_CASE("run_with_timeout", "[core][async]") {
    BackgroundTasks tasks;

    SECTION("work that finishes in time") {
        CancellationToken token;
        auto r = run_with_timeout<int>(tasks, []() -> Result<int> { return Ok(5); }, 1s, token);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == 5);
        REQUIRE_FALSE(token.is_cancelled());
    }

    SECTION("work errors pass through") {
        CancellationToken token;
        auto r = run_with_timeout<void>(tasks,
            []() -> Result<void> { return Err(Error(ErrorCode::IOError, "fail")); }, 1s, token);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::IOError);
    }

    SECTION("timer wins and cancels the token") {
        CancellationToken token;
        auto r = run_with_timeout<void>(tasks,
            [token]() -> Result<void> {
                token.wait_for(5s);
                return Ok();
            },
            20ms, token);

        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::Timeout);
        REQUIRE(token.is_cancelled());
        tasks.join_all();
    }

    SECTION("timer cancels a token held only as const") {
        const CancellationToken token;
        auto started = std::chrono::steady_clock::now();
        auto r = run_with_timeout<int>(tasks,
            [token]() -> Result<int> {
                token.wait_for(5s);
                return Ok(1);
            },
            10ms, token);

        REQUIRE(r.error().code() == ErrorCode::Timeout);
        REQUIRE(token.is_cancelled());
        tasks.join_all();
        REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    }

    SECTION("non-positive timeout runs inline") {
        CancellationToken token;
        auto caller = std::this_thread::get_id();
        std::thread::id ran_on;
        auto r = run_with_timeout<void>(tasks,
            [&ran_on]() -> Result<void> {
                ran_on = std::this_thread::get_id();
                return Ok();
            },
            0ms, token);

        REQUIRE(r.is_ok());
        REQUIRE(ran_on == caller);
    }

    SECTION("exceptions become errors") {
        CancellationToken token;
        auto r = run_with_timeout<void>(tasks,
            []() -> Result<void> { throw std::runtime_error("boom"); }, 1s, token);
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "boom");
    }
}
