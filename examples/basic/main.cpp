/// @file main.cpp
/// @brief Emitter walkthrough
///
/// Loads logging and emitter options from herald.json when present, then:
/// - Registers and emits plain listeners
/// - Shows once listeners and removal by handle
/// - Binds a custom receiver
/// - Clears the emitter

#include <herald/core/core.hpp>
#include <herald/event/event.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace {

struct Greeter {
    std::string name;
};

std::filesystem::path find_config_path() {
    std::vector<std::filesystem::path> candidates = {
        "herald.json",
        "examples/basic/herald.json",
        "../examples/basic/herald.json",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

herald_event::EmitterConfig load_config() {
    herald_core::init_logging();

    auto path = find_config_path();
    if (path.empty()) {
        HERALD_LOG_INFO("No herald.json found, using defaults");
        return {};
    }

    auto document = herald_core::read_json_file(path);
    if (!document) {
        HERALD_LOG_WARN("{}", herald_core::build_error_chain(document.error()));
        return {};
    }

    if (document->contains("log")) {
        auto log_config = herald_core::log_config_from_json((*document)["log"]);
        if (log_config) {
            herald_core::configure_logging(*log_config);
        } else {
            HERALD_LOG_WARN("{}", herald_core::build_error_chain(log_config.error()));
        }
    }

    auto emitter_config = herald_event::load_emitter_config(path);
    if (!emitter_config) {
        HERALD_LOG_WARN("{}", herald_core::build_error_chain(emitter_config.error()));
    }
    return emitter_config.value_or(herald_event::EmitterConfig{});
}

std::string join_names(const std::vector<herald_event::EventKey>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += herald_event::to_string(name);
    }
    return "[" + joined + "]";
}

} // namespace

int main() {
    using namespace herald_event::prelude;

    Emitter emitter(load_config());
    HERALD_LOG_INFO("Log level: {}, listener limit: {}",
                    herald_core::log_level_name(herald_core::get_global_log_level()),
                    emitter.max_listeners());

    HERALD_LOG_INFO("=== Basic usage ===");
    emitter.on("message", Listener::typed<std::string>([](const std::string& msg) {
        HERALD_LOG_INFO("Received message: {}", msg);
    }));
    emitter.on("data", Listener::typed<int, std::string>([](int id, const std::string& name) {
        HERALD_LOG_INFO("Received data: id={} name={}", id, name);
    }));

    emitter.emit("message", "Hello, World!");
    emitter.emit("data", 1, "John");

    HERALD_LOG_INFO("=== Once listener ===");
    emitter.once("welcome", Listener::typed<std::string>([](const std::string& name) {
        HERALD_LOG_INFO("Welcome {}! This will only fire once.", name);
    }));
    emitter.emit("welcome", "Alice");
    emitter.emit("welcome", "Bob");

    HERALD_LOG_INFO("=== Remove listener ===");
    auto goodbye = Listener::typed<std::string>([](const std::string& name) {
        HERALD_LOG_INFO("Goodbye {}!", name);
    });
    emitter.on("goodbye", goodbye);
    emitter.emit("goodbye", "Charlie");
    emitter.off("goodbye", goodbye);
    emitter.emit("goodbye", "David");

    HERALD_LOG_INFO("=== Event information ===");
    auto shutdown = Symbol::create("shutdown");
    emitter.on(shutdown, [] { HERALD_LOG_INFO("Shutting down"); });
    HERALD_LOG_INFO("Event names: {}", join_names(emitter.event_names()));
    HERALD_LOG_INFO("Listeners for \"message\": {}", emitter.listener_count("message"));
    HERALD_LOG_INFO("Listeners for \"data\": {}", emitter.listener_count("data"));

    HERALD_LOG_INFO("=== Custom context ===");
    Greeter greeter{"CustomContext"};
    emitter.on("context",
        Listener::typed<std::string>([](const Context& self, const std::string& data) {
            if (const auto* g = self.get<Greeter>()) {
                HERALD_LOG_INFO("Context: {}, Data: {}", g->name, data);
            }
        }),
        Context::of(greeter));
    emitter.emit("context", "test data");

    HERALD_LOG_INFO("=== Remove all listeners ===");
    emitter.emit(shutdown);
    HERALD_LOG_INFO("Before removal - Event names: {}", join_names(emitter.event_names()));
    emitter.remove_all_listeners();
    HERALD_LOG_INFO("After removal - Event names: {}", join_names(emitter.event_names()));

    if (herald_core::debug::total_error_count() > 0) {
        HERALD_LOG_WARN("{}", herald_core::debug::error_stats_summary());
    }

    herald_core::shutdown_logging();
    return 0;
}
