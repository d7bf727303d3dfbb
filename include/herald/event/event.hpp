#pragma once

/// @file event.hpp
/// @brief Main include header for herald_event
///
/// herald_event is a synchronous, in-process listener registry:
/// - Textual and symbolic event keys
/// - Listeners invoked in registration order on the emitting thread
/// - Once listeners, removed as they are selected
/// - Removal by listener identity, receiver and once flag
///
/// ## Quick Start
///
/// ```cpp
/// herald_event::Emitter emitter;
///
/// // Keep the handle to remove the listener later
/// auto greet = herald_event::Listener::typed<std::string>([](const std::string& name) {
///     spdlog::info("Hello, {}", name);
/// });
///
/// emitter.on("greet", greet);
/// emitter.emit("greet", "Alice");     // true
///
/// emitter.once("ready", [] { spdlog::info("ready"); });
/// emitter.emit("ready");              // runs and removes the listener
/// emitter.emit("ready");              // false
///
/// emitter.off("greet", greet);
/// ```

#include "fwd.hpp"
#include "key.hpp"
#include "listener.hpp"
#include "bucket.hpp"
#include "config.hpp"
#include "emitter.hpp"

namespace herald_event {

/// Prelude - commonly used types
namespace prelude {
    using herald_event::Symbol;
    using herald_event::EventKey;
    using herald_event::Context;
    using herald_event::Arguments;
    using herald_event::Listener;
    using herald_event::EmitterConfig;
    using herald_event::Emitter;
} // namespace prelude

} // namespace herald_event
