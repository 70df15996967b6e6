/// @file test_plugin_manager.cpp
/// @brief Tests for PluginManager and PluginCatalog

#include <catch2/catch_test_macros.hpp>
#include <sker/kernel/plugin.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sker_kernel;
using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::Ok;
using sker_core::Result;

namespace events = sker_event::events;

namespace {

struct Counter {
    int value = 0;
};

/// Records initialize/destroy calls into a shared journal
class JournalPlugin : public Plugin {
public:
    JournalPlugin(std::string name, std::vector<std::string>& journal, bool fail_init = false)
        : m_name(std::move(name)), m_journal(journal), m_fail_init(fail_init) {}

    std::string name() const override { return m_name; }

    Result<std::any> initialize(PluginContext& ctx) override {
        if (m_fail_init) {
            return Err<std::any>(Error(ErrorCode::IOError, m_name + " cannot connect"));
        }
        m_journal.push_back("init:" + m_name);
        auto counter = std::make_shared<Counter>();
        counter->value = ctx.option<int>("start", 0);
        return Ok<std::any>(counter);
    }

    Result<void> destroy() override {
        m_journal.push_back("destroy:" + m_name);
        return Ok();
    }

private:
    std::string m_name;
    std::vector<std::string>& m_journal;
    bool m_fail_init;
};

std::unique_ptr<Plugin> journal(const std::string& name, std::vector<std::string>& log, bool fail = false) {
    return std::make_unique<JournalPlugin>(name, log, fail);
}

} // anonymous namespace

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("PluginManager: registration", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;

    REQUIRE(manager.register_plugin("db", journal("db", log)).is_ok());
    REQUIRE(manager.has("db"));
    REQUIRE(manager.plugin_count() == 1);
    REQUIRE_FALSE(manager.is_initialized("db"));
    REQUIRE(log.empty());

    SECTION("duplicate name") {
        auto result = manager.register_plugin("db", journal("db", log));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::AlreadyExists);
        REQUIRE(manager.plugin_count() == 1);
    }

    SECTION("empty name") {
        auto result = manager.register_plugin("", journal("x", log));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("plugin without initializer") {
        auto result = manager.register_plugin("hollow", make_plugin("hollow", {}));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(manager.has("hollow"));
    }

    SECTION("null plugin") {
        REQUIRE(manager.register_plugin("null", nullptr).is_err());
    }

    SECTION("config name defaults to the registered name") {
        auto config = manager.plugin_config("db");
        REQUIRE(config.has_value());
        REQUIRE(config->name == "db");
        REQUIRE(config->enabled);
        REQUIRE_FALSE(manager.plugin_config("missing").has_value());
    }
}

TEST_CASE("PluginManager: unregister", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;
    REQUIRE(manager.register_plugin("cache", journal("cache", log)).is_ok());

    SECTION("unknown name is a no-op") {
        REQUIRE(manager.unregister_plugin("nope").is_ok());
        REQUIRE(manager.plugin_count() == 1);
    }

    SECTION("initialized plugin is refused") {
        REQUIRE(manager.initialize("cache").is_ok());
        auto result = manager.unregister_plugin("cache");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidState);
        REQUIRE(manager.has("cache"));

        REQUIRE(manager.destroy("cache").is_ok());
        REQUIRE(manager.unregister_plugin("cache").is_ok());
        REQUIRE_FALSE(manager.has("cache"));
    }
}

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("PluginManager: initialize and destroy order", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;
    std::vector<std::string> seen;

    static_cast<void>(manager.events().on_any([&seen](const std::string& event, const std::any&) {
        seen.push_back(event);
    }));

    REQUIRE(manager.register_plugin("a", journal("a", log)).is_ok());
    REQUIRE(manager.register_plugin("b", journal("b", log)).is_ok());
    REQUIRE(manager.register_plugin("c", journal("c", log)).is_ok());

    // Initialize one out of order first
    REQUIRE(manager.initialize("b").is_ok());
    REQUIRE(manager.initialize_all().is_ok());
    REQUIRE(manager.initialized_plugins() == std::vector<std::string>{"b", "a", "c"});

    // Already initialized: nothing runs twice
    REQUIRE(manager.initialize("a").is_ok());
    REQUIRE(log.size() == 3);

    REQUIRE(manager.destroy_all().is_ok());
    REQUIRE(log == std::vector<std::string>{
        "init:b", "init:a", "init:c", "destroy:c", "destroy:a", "destroy:b"});
    REQUIRE(manager.initialized_plugins().empty());

    auto count = [&seen](const std::string& event) {
        return std::count(seen.begin(), seen.end(), event);
    };
    REQUIRE(count(events::PLUGIN_REGISTERED) == 3);
    REQUIRE(count(events::PLUGIN_INITIALIZED) == 3);
    REQUIRE(count(events::PLUGIN_DESTROYED) == 3);
}

TEST_CASE("PluginManager: initialize unknown plugin", "[kernel][plugin]") {
    PluginManager manager;
    auto result = manager.initialize("ghost");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::NotFound);
    REQUIRE(manager.destroy("ghost").is_ok());
}

TEST_CASE("PluginManager: initialize_all keeps going past failures", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;
    std::vector<PluginErrorEvent> errors;

    REQUIRE(manager.on(events::PLUGIN_ERROR, [&errors](const std::any& p) {
        errors.push_back(std::any_cast<PluginErrorEvent>(p));
    }).is_ok());

    REQUIRE(manager.register_plugin("ok1", journal("ok1", log)).is_ok());
    REQUIRE(manager.register_plugin("bad", journal("bad", log, true)).is_ok());
    REQUIRE(manager.register_plugin("ok2", journal("ok2", log)).is_ok());
    REQUIRE(manager.register_plugin("worse", make_plugin("worse", [](PluginContext&) -> Result<std::any> {
        throw std::runtime_error("exploded");
    })).is_ok());

    auto result = manager.initialize_all();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::PluginFailed);
    REQUIRE(result.error().children().size() == 2);

    const std::string* plugins = result.error().get_context("plugins");
    REQUIRE(plugins != nullptr);
    REQUIRE(*plugins == "bad, worse");

    REQUIRE(manager.is_initialized("ok1"));
    REQUIRE(manager.is_initialized("ok2"));
    REQUIRE_FALSE(manager.is_initialized("bad"));

    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].name == "bad");
    REQUIRE(errors[0].phase == "initialize");
    REQUIRE(errors[1].error.root_cause().message() == "exploded");
}

TEST_CASE("PluginManager: destroy failure keeps the plugin initialized", "[kernel][plugin]") {
    PluginManager manager;
    REQUIRE(manager.register_plugin("sticky", make_plugin("sticky",
        [](PluginContext&) -> Result<std::any> { return Ok<std::any>(1); },
        []() -> Result<void> { return Err(Error("still busy")); })).is_ok());

    REQUIRE(manager.initialize("sticky").is_ok());

    auto result = manager.destroy_all();
    REQUIRE(result.is_err());
    REQUIRE(result.error().children().size() == 1);
    REQUIRE(result.error().children()[0].code() == ErrorCode::PluginFailed);
    REQUIRE(manager.is_initialized("sticky"));
}

// =============================================================================
// Instances and Config
// =============================================================================

TEST_CASE("PluginManager: instances and context", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;

    PluginConfig config;
    config.options["start"] = std::int64_t{41};
    REQUIRE(manager.register_plugin("counter", journal("counter", log), config).is_ok());

    REQUIRE(manager.get<std::shared_ptr<Counter>>("counter") == nullptr);
    REQUIRE(manager.initialize("counter").is_ok());

    auto* counter = manager.get<std::shared_ptr<Counter>>("counter");
    REQUIRE(counter != nullptr);
    REQUIRE((*counter)->value == 41);

    // Wrong type
    REQUIRE(manager.get<int>("counter") == nullptr);

    REQUIRE(manager.destroy("counter").is_ok());
    REQUIRE(manager.instance("counter") == nullptr);
}

TEST_CASE("PluginManager: update_plugin_config", "[kernel][plugin]") {
    PluginManager manager;
    sker_core::Options seen;

    PluginConfig config;
    config.options["level"] = std::string("info");
    config.options["port"] = std::int64_t{80};
    REQUIRE(manager.register_plugin("web", make_plugin("web", [&seen](PluginContext& ctx) -> Result<std::any> {
        seen = ctx.config;
        return Ok<std::any>(std::string("web"));
    }), config).is_ok());

    std::vector<PluginConfigUpdatedEvent> updates;
    REQUIRE(manager.on(events::PLUGIN_CONFIG_UPDATED, [&updates](const std::any& p) {
        updates.push_back(std::any_cast<PluginConfigUpdatedEvent>(p));
    }).is_ok());

    sker_core::Options patch;
    patch["port"] = std::int64_t{8080};
    REQUIRE(manager.update_plugin_config("web", patch).is_ok());
    REQUIRE(manager.initialize("web").is_ok());

    REQUIRE(std::get<std::int64_t>(seen.at("port")) == 8080);
    REQUIRE(std::get<std::string>(seen.at("level")) == "info");
    REQUIRE(std::get<std::int64_t>(manager.plugin_config("web")->options.at("port")) == 8080);

    REQUIRE(updates.size() == 1);
    REQUIRE(std::get<std::int64_t>(updates[0].old_config.at("port")) == 80);

    REQUIRE(manager.update_plugin_config("missing", patch).is_err());
    REQUIRE(manager.destroy_all().is_ok());
}

// =============================================================================
// Enable / Disable
// =============================================================================

TEST_CASE("PluginManager: enable and disable", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;
    std::vector<std::string> skipped;

    REQUIRE(manager.on(events::PLUGIN_SKIPPED, [&skipped](const std::any& p) {
        skipped.push_back(std::any_cast<PluginSkippedEvent>(p).name);
    }).is_ok());

    PluginConfig config;
    config.enabled = false;
    REQUIRE(manager.register_plugin("optional", journal("optional", log), config).is_ok());

    REQUIRE(manager.initialize_all().is_ok());
    REQUIRE_FALSE(manager.is_initialized("optional"));
    REQUIRE(skipped == std::vector<std::string>{"optional"});

    REQUIRE(manager.enable("optional").is_ok());
    REQUIRE(manager.is_initialized("optional"));
    REQUIRE(manager.plugin_config("optional")->enabled);

    // Already enabled
    REQUIRE(manager.enable("optional").is_ok());
    REQUIRE(log.size() == 1);

    REQUIRE(manager.disable("optional").is_ok());
    REQUIRE_FALSE(manager.is_initialized("optional"));
    REQUIRE_FALSE(manager.plugin_config("optional")->enabled);
    REQUIRE(log == std::vector<std::string>{"init:optional", "destroy:optional"});

    REQUIRE(manager.enable("unknown").is_err());
    REQUIRE(manager.disable("unknown").is_err());
}

TEST_CASE("PluginManager: info snapshot", "[kernel][plugin]") {
    PluginManager manager;
    std::vector<std::string> log;
    REQUIRE(manager.register_plugin("a", journal("a", log)).is_ok());
    REQUIRE(manager.register_plugin("b", make_plugin("b",
        [](PluginContext&) -> Result<std::any> { return Ok<std::any>(0); }, {},
        sker_core::Version{2, 1, 0})).is_ok());
    REQUIRE(manager.initialize("b").is_ok());

    auto info = manager.all_plugin_info();
    REQUIRE(info.size() == 2);
    REQUIRE_FALSE(info.at("a").initialized);
    REQUIRE(info.at("b").initialized);
    REQUIRE(info.at("b").version == sker_core::Version{2, 1, 0});
    REQUIRE(manager.registered_plugins() == std::vector<std::string>{"a", "b"});

    REQUIRE(manager.destroy_all().is_ok());
}

// =============================================================================
// PluginCatalog
// =============================================================================

TEST_CASE("PluginCatalog: create from descriptors", "[kernel][plugin][catalog]") {
    PluginCatalog catalog;
    std::vector<std::string> log;

    REQUIRE(catalog.add("journal", [&log](const PluginConfig& config) {
        return journal(config.name, log);
    }).is_ok());

    SECTION("by package") {
        auto plugin = catalog.create(PluginConfig{"audit", "journal", {}, true});
        REQUIRE(plugin.is_ok());
        REQUIRE(plugin.value()->name() == "audit");
    }

    SECTION("name doubles as package") {
        auto plugin = catalog.create(PluginConfig{"journal", "", {}, true});
        REQUIRE(plugin.is_ok());
    }

    SECTION("unknown package") {
        auto plugin = catalog.create(PluginConfig{"audit", "missing", {}, true});
        REQUIRE(plugin.is_err());
        REQUIRE(plugin.error().code() == ErrorCode::NotFound);
    }

    SECTION("duplicate package") {
        auto again = catalog.add("journal", [&log](const PluginConfig&) { return journal("x", log); });
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::AlreadyExists);
    }

    SECTION("factory returning nothing") {
        REQUIRE(catalog.add("empty", [](const PluginConfig&) { return std::unique_ptr<Plugin>{}; }).is_ok());
        auto plugin = catalog.create(PluginConfig{"e", "empty", {}, true});
        REQUIRE(plugin.is_err());
        REQUIRE(plugin.error().code() == ErrorCode::PluginFailed);
    }

    SECTION("remove") {
        REQUIRE(catalog.remove("journal"));
        REQUIRE_FALSE(catalog.contains("journal"));
        REQUIRE(catalog.packages().empty());
    }
}
