// sker_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <sker/core/error.hpp>
#include <stdexcept>
#include <string>

using namespace sker_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("PluginError::not_found") {
        Error err = PluginError::not_found("test_plugin");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.message().find("test_plugin") != std::string::npos);
        REQUIRE(err.is<PluginError>());
    }

    SECTION("PluginError::already_registered") {
        Error err = PluginError::already_registered("test_plugin");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }

    SECTION("LifecycleError hook failures map to their phase") {
        Error start = LifecycleError::hook_failed("db", "start", "refused");
        Error stop = LifecycleError::hook_failed("db", "stop", "refused");
        REQUIRE(start.code() == ErrorCode::StartFailed);
        REQUIRE(stop.code() == ErrorCode::StopFailed);
        REQUIRE(start.as<LifecycleError>()->hook == "db");
    }

    SECTION("LifecycleError::hook_timeout") {
        Error err = LifecycleError::hook_timeout("slow", "start", 50);
        REQUIRE(err.code() == ErrorCode::Timeout);
        REQUIRE(err.message().find("50ms") != std::string::npos);
    }

    SECTION("MiddlewareError kinds") {
        REQUIRE(Error(MiddlewareError::timeout(10)).code() == ErrorCode::Timeout);
        REQUIRE(Error(MiddlewareError::cancelled("auth", {})).code() == ErrorCode::Cancelled);
        REQUIRE(Error(MiddlewareError::handler_failed("auth", {"auth"}, "boom")).code()
                == ErrorCode::MiddlewareFailed);
    }

    SECTION("ConfigError kinds") {
        REQUIRE(Error(ConfigError::parse_error("a.json", "bad")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::io_error("a.json", "denied")).code() == ErrorCode::IOError);
        REQUIRE(Error(ConfigError::invalid("port")).code() == ErrorCode::ConfigInvalid);
    }
}

TEST_CASE("Error causes and children", "[core][error]") {
    SECTION("cause chain") {
        Error root(ErrorCode::IOError, "disk gone");
        Error middle(ErrorCode::PluginFailed, "storage failed");
        middle.with_cause(root);
        Error top(ErrorCode::StartFailed, "service failed");
        top.with_cause(middle);

        REQUIRE(top.cause() != nullptr);
        REQUIRE(top.cause()->message() == "storage failed");
        REQUIRE(top.root_cause().message() == "disk gone");
        REQUIRE(root.cause() == nullptr);
        REQUIRE(&root.root_cause() == &root);
    }

    SECTION("aggregate") {
        Error err = Error::aggregate(ErrorCode::StopFailed, "2 failed",
            {Error("first"), Error("second")});
        REQUIRE(err.code() == ErrorCode::StopFailed);
        REQUIRE(err.children().size() == 2);
        REQUIRE(err.children()[1].message() == "second");
    }

    SECTION("build_error_chain includes causes and children") {
        Error err(ErrorCode::StopFailed, "outer");
        err.with_cause(Error(ErrorCode::Timeout, "inner"));
        err.add_child(Error("child failure"));

        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[StopFailed] outer") != std::string::npos);
        REQUIRE(chain.find("caused by: [Timeout] inner") != std::string::npos);
        REQUIRE(chain.find("child failure") != std::string::npos);
    }
}

TEST_CASE("Exception conversion", "[core][error]") {
    SECTION("error_from_exception") {
        std::runtime_error e("broken");
        Error err = error_from_exception(e, ErrorCode::PluginFailed);
        REQUIRE(err.code() == ErrorCode::PluginFailed);
        REQUIRE(err.message() == "broken");
    }

    SECTION("invoke_guarded turns a throw into an error") {
        Result<void> r = invoke_guarded([]() { throw std::logic_error("nope"); }, ErrorCode::EventFailed);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::EventFailed);
        REQUIRE(r.error().message() == "nope");
    }

    SECTION("invoke_guarded passes a Result through") {
        auto r = invoke_guarded([]() -> Result<int> { return Ok(7); });
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == 7);
    }

    SECTION("invoke_guarded with a non-standard exception") {
        Result<void> r = invoke_guarded([]() { throw 42; }, ErrorCode::MiddlewareFailed);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::MiddlewareFailed);
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>("Something went wrong");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something went wrong");
    }

    SECTION("Err void") {
        Result<void> r = Err("Failed");
        REQUIRE(r.is_err());
        REQUIRE_FALSE(static_cast<bool>(r));
    }
}

TEST_CASE("Result operations", "[core][result]") {
    SECTION("value_or") {
        Result<int> ok = Ok(10);
        Result<int> err = Err<int>("Error");
        REQUIRE(ok.value_or(0) == 10);
        REQUIRE(err.value_or(0) == 0);
    }

    SECTION("map") {
        Result<int> r = Ok(5);
        auto mapped = r.map([](int x) { return x * 2; });
        REQUIRE(mapped.is_ok());
        REQUIRE(mapped.value() == 10);
    }

    SECTION("map on error") {
        Result<int> r = Err<int>("Error");
        auto mapped = r.map([](int x) { return x * 2; });
        REQUIRE(mapped.is_err());
    }

    SECTION("and_then") {
        Result<int> r = Ok(5);
        auto chained = r.and_then([](int x) -> Result<int> {
            if (x > 0) return Ok(x * 2);
            return Err<int>("Negative");
        });
        REQUIRE(chained.is_ok());
        REQUIRE(chained.value() == 10);
    }

    SECTION("unwrap on error throws") {
        Result<int> r = Err<int>("Error");
        REQUIRE_THROWS(r.unwrap());
    }
}
