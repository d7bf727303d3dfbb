#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for herald_event

namespace herald_event {

// Keys
class Symbol;
class EventKey;

// Listeners
class Context;
class Listener;
struct ListenerRecord;

// Storage
class Bucket;

// Registry
struct EmitterConfig;
class Emitter;

} // namespace herald_event
