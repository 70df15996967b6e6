/// @file test_middleware.cpp
/// @brief Tests for MiddlewareManager

#include <catch2/catch_test_macros.hpp>
#include <sker/kernel/middleware.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sker_kernel;
using namespace std::chrono_literals;
using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::MiddlewareError;
using sker_core::Ok;
using sker_core::Result;

namespace events = sker_event::events;

namespace {

/// Middleware that records its name and continues
MiddlewareHandler tracer(std::vector<std::string>& trace, std::string label) {
    return [&trace, label = std::move(label)](MiddlewareContext&, const Next& next) -> Result<void> {
        trace.push_back(label);
        return next();
    };
}

MiddlewareOptions named(std::string name, std::int32_t priority = 0) {
    MiddlewareOptions options;
    options.name = std::move(name);
    options.priority = priority;
    return options;
}

} // anonymous namespace

// =============================================================================
// Context
// =============================================================================

TEST_CASE("MiddlewareContext: create", "[kernel][middleware]") {
    auto ctx = MiddlewareContext::create();
    REQUIRE(ctx.request_id.size() == 36);
    REQUIRE(ctx.trace_id.size() == 36);
    REQUIRE(ctx.request_id != ctx.trace_id);
    REQUIRE_FALSE(ctx.cancelled());

    auto fixed = MiddlewareContext::create("req-1", "trace-1");
    REQUIRE(fixed.request_id == "req-1");
    REQUIRE(fixed.trace_id == "trace-1");

    fixed.request = std::string("GET /");
    REQUIRE(*fixed.request_as<std::string>() == "GET /");
    REQUIRE(fixed.response_as<int>() == nullptr);
}

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("MiddlewareManager: registration", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    auto id = manager.use(tracer(trace, "auth"), named("auth"));
    REQUIRE(id.is_ok());
    REQUIRE(id.value().is_valid());
    REQUIRE(manager.middleware_count() == 1);
    REQUIRE(manager.has_middleware("auth"));
    REQUIRE(manager.has_middleware(id.value()));

    SECTION("empty handler is rejected") {
        auto result = manager.use(MiddlewareHandler{});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("remove by name and id") {
        REQUIRE(manager.remove("auth"));
        REQUIRE_FALSE(manager.remove("auth"));

        auto other = manager.use(tracer(trace, "x"));
        REQUIRE(manager.remove(other.value()));
        REQUIRE(manager.middleware_count() == 0);
    }

    SECTION("clear") {
        REQUIRE(manager.use(tracer(trace, "y")).is_ok());
        std::size_t cleared = 0;
        REQUIRE(manager.on(events::MIDDLEWARES_CLEARED, [&cleared](const std::any& p) {
            cleared = std::any_cast<MiddlewaresClearedEvent>(p).count;
        }).is_ok());
        manager.clear();
        REQUIRE(cleared == 2);
        REQUIRE(manager.middleware_count() == 0);
    }
}

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("MiddlewareManager: priority ordering", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use(tracer(trace, "log"), named("log", 10)).is_ok());
    REQUIRE(manager.use(tracer(trace, "auth"), named("auth", -5)).is_ok());
    REQUIRE(manager.use(tracer(trace, "metrics"), named("metrics", 10)).is_ok());
    REQUIRE(manager.use(tracer(trace, "route"), named("route", 0)).is_ok());

    REQUIRE(manager.execution_order() == std::vector<std::string>{"auth", "route", "log", "metrics"});

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(trace == std::vector<std::string>{"auth", "route", "log", "metrics"});

    // Registration order is kept in the listing
    auto listed = manager.middlewares();
    REQUIRE(listed.size() == 4);
    REQUIRE(listed[0].name == "log");
}

TEST_CASE("MiddlewareManager: anonymous entries", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use(tracer(trace, "a")).is_ok());
    REQUIRE(manager.use(tracer(trace, "b"), named("named")).is_ok());
    REQUIRE(manager.use(tracer(trace, "c")).is_ok());

    REQUIRE(manager.execution_order() == std::vector<std::string>{"anonymous-1", "named", "anonymous-3"});
}

TEST_CASE("MiddlewareManager: enable and disable keep position", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use(tracer(trace, "a"), named("a")).is_ok());
    REQUIRE(manager.use(tracer(trace, "b"), named("b")).is_ok());
    REQUIRE(manager.use(tracer(trace, "c"), named("c")).is_ok());

    REQUIRE(manager.disable("b"));
    REQUIRE(manager.enabled_middleware_count() == 2);
    REQUIRE(manager.execution_order() == std::vector<std::string>{"a", "c"});

    REQUIRE(manager.enable("b"));
    REQUIRE(manager.execution_order() == std::vector<std::string>{"a", "b", "c"});

    REQUIRE_FALSE(manager.disable("missing"));

    SECTION("registered disabled") {
        MiddlewareOptions options = named("d");
        options.enabled = false;
        REQUIRE(manager.use(tracer(trace, "d"), options).is_ok());
        REQUIRE(manager.execution_order().size() == 3);
    }
}

TEST_CASE("MiddlewareManager: insert_before and insert_after", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use(tracer(trace, "first"), named("first", -1)).is_ok());
    REQUIRE(manager.use(tracer(trace, "auth"), named("auth", 5)).is_ok());
    REQUIRE(manager.use(tracer(trace, "route"), named("route", 5)).is_ok());

    REQUIRE(manager.insert_before("auth", tracer(trace, "cors"), named("cors", 100)));
    REQUIRE(manager.insert_after("auth", tracer(trace, "session"), named("session", -100)));
    REQUIRE_FALSE(manager.insert_after("missing", tracer(trace, "x"), named("x")));

    REQUIRE(manager.execution_order()
        == std::vector<std::string>{"first", "cors", "auth", "session", "route"});

    // The inserted entry adopts the anchor's priority
    for (const auto& info : manager.middlewares()) {
        if (info.name == "cors" || info.name == "session") {
            REQUIRE(info.priority == 5);
        }
    }

    SECTION("requested priority does not move the entry later on") {
        std::optional<std::int32_t> reported;
        static_cast<void>(manager.on(events::MIDDLEWARE_INSERTED, [&reported](const std::any& payload) {
            reported = std::any_cast<const MiddlewareInsertedEvent&>(payload).middleware.priority;
        }));

        REQUIRE(manager.insert_after("route", tracer(trace, "audit"), named("audit", 50)));
        REQUIRE(reported == 5);

        REQUIRE(manager.use(tracer(trace, "render"), named("render", 20)).is_ok());
        REQUIRE(manager.execution_order()
            == std::vector<std::string>{"first", "cors", "auth", "session", "route", "audit", "render"});
    }
}

// =============================================================================
// Execution
// =============================================================================

TEST_CASE("MiddlewareManager: empty chain", "[kernel][middleware]") {
    MiddlewareManager manager;
    int emitted = 0;
    static_cast<void>(manager.events().on_any([&emitted](const std::string&, const std::any&) { ++emitted; }));

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(emitted == 0);
}

TEST_CASE("MiddlewareManager: short-circuit", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;
    std::vector<std::string> completed;

    REQUIRE(manager.use(tracer(trace, "a"), named("a")).is_ok());
    REQUIRE(manager.use([&trace](MiddlewareContext& ctx, const Next&) -> Result<void> {
        trace.push_back("cache");
        ctx.response = std::string("cached");
        return Ok();
    }, named("cache")).is_ok());
    REQUIRE(manager.use(tracer(trace, "handler"), named("handler")).is_ok());

    REQUIRE(manager.on(events::MIDDLEWARE_CHAIN_COMPLETED, [&completed](const std::any& p) {
        completed = std::any_cast<MiddlewareChainEvent>(p).executed;
    }).is_ok());

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(trace == std::vector<std::string>{"a", "cache"});
    REQUIRE(*ctx.response_as<std::string>() == "cached");
    REQUIRE(completed == std::vector<std::string>{"a", "cache"});
}

TEST_CASE("MiddlewareManager: context flows through the chain", "[kernel][middleware]") {
    MiddlewareManager manager;

    REQUIRE(manager.use([](MiddlewareContext& ctx, const Next& next) -> Result<void> {
        ctx.data.insert("user", std::string("alice"));
        auto result = next();
        ctx.metadata.insert("after", true);
        return result;
    }).is_ok());
    REQUIRE(manager.use([](MiddlewareContext& ctx, const Next& next) -> Result<void> {
        const std::string* user = ctx.data.get<std::string>("user");
        ctx.response = user ? "hello " + *user : std::string("anonymous");
        return next();
    }).is_ok());

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(*ctx.response_as<std::string>() == "hello alice");
    REQUIRE(ctx.metadata.contains("after"));
}

TEST_CASE("MiddlewareManager: failure propagates once", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;
    std::vector<MiddlewareErrorEvent> errors;
    std::vector<MiddlewareChainEvent> failed;

    REQUIRE(manager.use(tracer(trace, "outer"), named("outer")).is_ok());
    REQUIRE(manager.use([](MiddlewareContext&, const Next&) -> Result<void> {
        throw std::runtime_error("validation exploded");
    }, named("validate")).is_ok());
    REQUIRE(manager.use(tracer(trace, "never"), named("never")).is_ok());

    REQUIRE(manager.on(events::MIDDLEWARE_ERROR, [&errors](const std::any& p) {
        errors.push_back(std::any_cast<MiddlewareErrorEvent>(p));
    }).is_ok());
    REQUIRE(manager.on(events::MIDDLEWARE_CHAIN_FAILED, [&failed](const std::any& p) {
        failed.push_back(std::any_cast<MiddlewareChainEvent>(p));
    }).is_ok());

    auto ctx = MiddlewareContext::create();
    auto result = manager.execute(ctx);

    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::MiddlewareFailed);
    REQUIRE(result.error().as<MiddlewareError>()->middleware == "validate");
    REQUIRE(result.error().root_cause().message() == "validation exploded");
    REQUIRE(trace == std::vector<std::string>{"outer"});

    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].name == "validate");
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0].executed == std::vector<std::string>{"outer", "validate"});
    REQUIRE(failed[0].error.has_value());
}

TEST_CASE("MiddlewareManager: returned error is a failure", "[kernel][middleware]") {
    MiddlewareManager manager;
    REQUIRE(manager.use([](MiddlewareContext&, const Next&) -> Result<void> {
        return Err(Error(ErrorCode::InvalidArgument, "missing header"));
    }, named("headers")).is_ok());

    auto ctx = MiddlewareContext::create();
    auto result = manager.execute(ctx);
    REQUIRE(result.is_err());
    REQUIRE(result.error().cause()->message() == "missing header");
}

TEST_CASE("MiddlewareManager: next called twice", "[kernel][middleware]") {
    MiddlewareManager manager;
    int downstream = 0;
    std::optional<Error> second_error;

    REQUIRE(manager.use([&second_error](MiddlewareContext&, const Next& next) -> Result<void> {
        auto first = next();
        auto second = next();
        if (second.is_err()) {
            second_error = second.error();
        }
        return first;
    }, named("greedy")).is_ok());
    REQUIRE(manager.use([&downstream](MiddlewareContext&, const Next& next) -> Result<void> {
        ++downstream;
        return next();
    }).is_ok());

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(downstream == 1);
    REQUIRE(second_error.has_value());
    REQUIRE(second_error->code() == ErrorCode::InvalidState);
}

TEST_CASE("MiddlewareManager: changes during execution apply to the next run", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use([&manager, &trace](MiddlewareContext&, const Next& next) -> Result<void> {
        trace.push_back("remover");
        manager.remove("victim");
        return next();
    }, named("remover")).is_ok());
    REQUIRE(manager.use(tracer(trace, "victim"), named("victim")).is_ok());

    auto ctx = MiddlewareContext::create();
    REQUIRE(manager.execute(ctx).is_ok());
    REQUIRE(trace == std::vector<std::string>{"remover", "victim"});

    trace.clear();
    auto again = MiddlewareContext::create();
    REQUIRE(manager.execute(again).is_ok());
    REQUIRE(trace == std::vector<std::string>{"remover"});
}

TEST_CASE("MiddlewareManager: cancelled context stops the chain", "[kernel][middleware]") {
    MiddlewareManager manager;
    std::vector<std::string> trace;

    REQUIRE(manager.use([&trace](MiddlewareContext& ctx, const Next& next) -> Result<void> {
        trace.push_back("first");
        ctx.cancellation.cancel();
        return next();
    }, named("first")).is_ok());
    REQUIRE(manager.use(tracer(trace, "second"), named("second")).is_ok());

    auto ctx = MiddlewareContext::create();
    auto result = manager.execute(ctx);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::Cancelled);
    REQUIRE(trace == std::vector<std::string>{"first"});
}

// =============================================================================
// Timeout
// =============================================================================

TEST_CASE("MiddlewareManager: execute_with_timeout", "[kernel][middleware][timeout]") {
    std::atomic<int> timeouts{0};
    std::atomic<bool> handler_saw_cancel{false};
    MiddlewareManager manager;

    REQUIRE(manager.on(events::MIDDLEWARE_TIMEOUT, [&timeouts](const std::any&) {
        timeouts.fetch_add(1);
    }).is_ok());

    SECTION("slow chain times out") {
        REQUIRE(manager.use([&handler_saw_cancel](MiddlewareContext& ctx, const Next&) -> Result<void> {
            // Never completes on its own
            while (!ctx.cancellation.wait_for(5ms)) {
            }
            handler_saw_cancel.store(true);
            return Ok();
        }, named("hang")).is_ok());

        auto ctx = std::make_shared<MiddlewareContext>(MiddlewareContext::create("req-timeout"));
        auto started = std::chrono::steady_clock::now();
        auto result = manager.execute_with_timeout(ctx, 30ms);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::Timeout);
        REQUIRE(*result.error().get_context("request_id") == "req-timeout");
        REQUIRE(elapsed < 2s);
        REQUIRE(timeouts.load() == 1);
        REQUIRE(ctx->cancelled());
    }

    SECTION("fast chain completes") {
        REQUIRE(manager.use([](MiddlewareContext& ctx, const Next& next) -> Result<void> {
            ctx.response = 200;
            return next();
        }).is_ok());

        auto ctx = std::make_shared<MiddlewareContext>(MiddlewareContext::create());
        REQUIRE(manager.execute_with_timeout(ctx, 1s).is_ok());
        REQUIRE(*ctx->response_as<int>() == 200);
        REQUIRE(timeouts.load() == 0);
    }

    SECTION("chain failure is not a timeout") {
        REQUIRE(manager.use([](MiddlewareContext&, const Next&) -> Result<void> {
            return Err(Error("denied"));
        }, named("deny")).is_ok());

        auto ctx = std::make_shared<MiddlewareContext>(MiddlewareContext::create());
        auto result = manager.execute_with_timeout(ctx, 1s);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::MiddlewareFailed);
        REQUIRE(timeouts.load() == 0);
    }

    SECTION("null context") {
        REQUIRE(manager.execute_with_timeout(nullptr, 1s).is_err());
    }
}
