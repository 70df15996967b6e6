/// @file main.cpp
/// @brief Service Kernel Demo
///
/// Runs a small service on the sker kernel:
/// - A request counter plugin registered in the global catalog
/// - Middleware for request ids, authorization and handling
/// - Start/stop hooks and graceful shutdown on SIGINT/SIGTERM
///
/// Usage: service_demo [manifest.json]

#include <sker/kernel/kernel.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

// =============================================================================
// Request Counter Plugin
// =============================================================================

struct RequestCounter {
    std::atomic<std::int64_t> handled{0};
    std::atomic<std::int64_t> rejected{0};
};

class RequestCounterPlugin : public sker_kernel::Plugin {
public:
    [[nodiscard]] std::string name() const override { return "request-counter"; }

    [[nodiscard]] sker_core::Version version() const override { return sker_core::Version{1, 0, 0}; }

    sker_core::Result<std::any> initialize(sker_kernel::PluginContext& ctx) override {
        m_logger = ctx.logger;
        m_counter = std::make_shared<RequestCounter>();
        m_logger->info("Counting requests (report every {})", ctx.option<std::int64_t>("report_every", 2));
        return sker_core::Ok<std::any>(m_counter);
    }

    sker_core::Result<void> destroy() override {
        m_logger->info("Handled {} request(s), rejected {}", m_counter->handled.load(), m_counter->rejected.load());
        m_counter.reset();
        return sker_core::Ok();
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<RequestCounter> m_counter;
};

SKER_REGISTER_PLUGIN("request-counter", RequestCounterPlugin)

// =============================================================================
// Setup
// =============================================================================

sker_core::Result<sker_kernel::CoreOptions> load_options(int argc, char* argv[]) {
    if (argc > 1) {
        spdlog::info("Loading manifest: {}", argv[1]);
        return sker_kernel::CoreOptions::from_json_file(argv[1]);
    }

    sker_kernel::CoreOptions options;
    options.service_name = "service-demo";
    options.version = "0.1.0";

    sker_kernel::PluginConfig counter;
    counter.name = "counter";
    counter.package = "request-counter";
    counter.options["report_every"] = std::int64_t{2};
    options.plugins.push_back(counter);

    options.lifecycle.graceful_shutdown = true;
    options.lifecycle.start_timeout = std::chrono::milliseconds(2000);

    options.config.defaults["demo.requests"] = std::vector<std::string>{"alice", "bob", "forbidden", "carol"};
    options.config.defaults["demo.run_for_ms"] = std::int64_t{0};
    options.config.env_prefix = "SERVICE_DEMO_";
    return sker_core::Ok(std::move(options));
}

void install_middleware(sker_kernel::Core& core) {
    auto& middleware = core.middleware();

    sker_kernel::MiddlewareOptions request_id;
    request_id.name = "request-id";
    request_id.priority = -10;
    auto added = middleware.use([](sker_kernel::MiddlewareContext& ctx, const sker_kernel::Next& next) {
        ctx.metadata.insert("request_id", ctx.request_id);
        auto result = next();
        spdlog::debug("[{}] finished in {}ms", ctx.request_id, ctx.elapsed().count());
        return result;
    }, request_id);
    if (!added) {
        spdlog::warn("Could not add request-id middleware: {}", added.error().message());
    }

    sker_kernel::MiddlewareOptions auth;
    auth.name = "auth";
    added = middleware.use([&core](sker_kernel::MiddlewareContext& ctx, const sker_kernel::Next& next)
                               -> sker_core::Result<void> {
        const std::string* user = ctx.request_as<std::string>();
        if (!user || *user == "forbidden") {
            if (auto counter = core.get_plugin<std::shared_ptr<RequestCounter>>("counter")) {
                (*counter.value())->rejected.fetch_add(1);
            }
            return sker_core::Err(sker_core::Error(sker_core::ErrorCode::InvalidArgument, "unauthorized"));
        }
        ctx.data.insert("user", *user);
        return next();
    }, auth);
    if (!added) {
        spdlog::warn("Could not add auth middleware: {}", added.error().message());
    }

    sker_kernel::MiddlewareOptions handler;
    handler.name = "handler";
    handler.priority = 100;
    added = middleware.use([&core](sker_kernel::MiddlewareContext& ctx, const sker_kernel::Next& next) {
        const std::string* user = ctx.data.get<std::string>("user");
        ctx.response = std::string("hello, ") + (user ? *user : "stranger");
        if (auto counter = core.get_plugin<std::shared_ptr<RequestCounter>>("counter")) {
            (*counter.value())->handled.fetch_add(1);
        }
        return next();
    }, handler);
    if (!added) {
        spdlog::warn("Could not add handler middleware: {}", added.error().message());
    }
}

void install_hooks(sker_kernel::Core& core) {
    auto& lifecycle = core.lifecycle();

    auto hook = lifecycle.on_start([&core]() -> sker_core::Result<void> {
        spdlog::info("Accepting requests for {} ({})", core.service_name(), core.environment());
        return sker_core::Ok();
    }, sker_kernel::HookOptions{"accept", std::nullopt});
    if (!hook) {
        spdlog::warn("Could not add start hook: {}", hook.error().message());
    }

    hook = lifecycle.on_stop([]() -> sker_core::Result<void> {
        spdlog::info("No longer accepting requests");
        return sker_core::Ok();
    }, sker_kernel::HookOptions{"drain", std::nullopt});
    if (!hook) {
        spdlog::warn("Could not add stop hook: {}", hook.error().message());
    }
}

void serve(sker_kernel::Core& core) {
    for (const auto& user : core.config().get_string_array("demo.requests")) {
        auto ctx = std::make_shared<sker_kernel::MiddlewareContext>(sker_kernel::MiddlewareContext::create());
        ctx->request = user;

        auto result = core.middleware().execute_with_timeout(ctx, std::chrono::milliseconds(500));
        if (result) {
            spdlog::info("[{}] {}", ctx->request_id, *ctx->response_as<std::string>());
        } else {
            spdlog::warn("[{}] {}", ctx->request_id, result.error().message());
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    sker_core::LogConfig log_config;
    log_config.level = spdlog::level::info;
    sker_core::configure_logging(log_config);
    spdlog::info("=== Service Kernel Demo ===");

    auto options = load_options(argc, argv);
    if (!options) {
        spdlog::error("Invalid service manifest: {}", options.error().message());
        return EXIT_FAILURE;
    }

    auto created = sker_kernel::Core::create(std::move(options).value());
    if (!created) {
        spdlog::error("{}", sker_core::build_error_chain(created.error()));
        return EXIT_FAILURE;
    }
    std::unique_ptr<sker_kernel::Core> core = std::move(created).value();

    auto failed = core->on(sker_event::events::CORE_PLUGIN_ERROR, [](const std::any& payload) {
        const auto& event = std::any_cast<const sker_kernel::PluginErrorEvent&>(payload);
        spdlog::error("Plugin {} failed during {}", event.name, event.phase);
    });
    if (!failed) {
        spdlog::warn("Could not subscribe to plugin errors: {}", failed.error().message());
    }

    install_hooks(*core);
    install_middleware(*core);

    auto started = core->start();
    if (!started) {
        spdlog::error("{}", sker_core::build_error_chain(started.error()));
        auto stopped = core->stop();
        if (!stopped) {
            spdlog::error("{}", sker_core::build_error_chain(stopped.error()));
        }
        return EXIT_FAILURE;
    }

    serve(*core);
    spdlog::info("{}", core->info().to_json());

    auto run_for = std::chrono::milliseconds(core->config().get_int("demo.run_for_ms"));
    if (run_for.count() > 0) {
        spdlog::info("Running for {}ms, press Ctrl+C to stop early", run_for.count());
        if (core->lifecycle().wait_for_state(sker_kernel::LifecycleState::Stopped, run_for)) {
            spdlog::info("Shutdown signal received");
        }
    }

    auto stopped = core->stop();
    if (!stopped) {
        spdlog::error("{}", sker_core::build_error_chain(stopped.error()));
        return EXIT_FAILURE;
    }

    spdlog::info("Goodbye!");
    sker_core::shutdown_logging();
    return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        spdlog::error("FATAL EXCEPTION: {}", e.what());
        sker_core::flush_all_loggers();
        return EXIT_FAILURE;
    }
}
