#pragma once

/// @file listener.hpp
/// @brief Listener handles, receivers and argument packs

#include "fwd.hpp"
#include <herald/core/error.hpp>

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace herald_event {

// =============================================================================
// Context
// =============================================================================

/// Receiver bound to a listener invocation
///
/// Non-owning. Two contexts are identical when they refer to the same object
/// of the same type. A default-constructed Context means "unspecified".
class Context {
public:
    Context() noexcept = default;

    /// Bind to an lvalue; the caller keeps it alive while registered
    template<typename T>
    [[nodiscard]] static Context of(T& receiver) noexcept {
        using U = std::remove_cv_t<T>;
        return Context(
            static_cast<void*>(const_cast<U*>(std::addressof(receiver))),
            std::type_index(typeid(U)),
            std::is_const_v<T>);
    }

    template<typename T>
    static Context of(const T&&) = delete;

    [[nodiscard]] bool has_value() const noexcept { return m_ptr != nullptr; }
    explicit operator bool() const noexcept { return has_value(); }

    /// Typed access to the receiver; nullptr on type mismatch, or when asking
    /// for mutable access to a receiver bound as const
    template<typename T>
    [[nodiscard]] T* get() const noexcept {
        using U = std::remove_cv_t<T>;
        if (!m_ptr || m_type != std::type_index(typeid(U))) {
            return nullptr;
        }
        if (m_const && !std::is_const_v<T>) {
            return nullptr;
        }
        return static_cast<T*>(m_ptr);
    }

    [[nodiscard]] const void* address() const noexcept { return m_ptr; }
    [[nodiscard]] std::type_index type() const noexcept { return m_type; }

    bool operator==(const Context& other) const noexcept {
        return m_ptr == other.m_ptr && m_type == other.m_type;
    }
    bool operator!=(const Context& other) const noexcept { return !(*this == other); }

private:
    Context(void* ptr, std::type_index type, bool is_const) noexcept
        : m_ptr(ptr), m_type(type), m_const(is_const) {}

    void* m_ptr = nullptr;
    std::type_index m_type{typeid(void)};
    bool m_const = false;
};

// =============================================================================
// Arguments
// =============================================================================

/// Type-erased emit arguments, in call order
using Arguments = std::vector<std::any>;

namespace detail {

/// Convert one emit argument to its stored form; character strings are
/// stored as std::string
template<typename T>
std::any to_argument(T&& value) {
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
        const char* text = value;
        return std::any(text ? std::string(text) : std::string());
    } else if constexpr (std::is_same_v<D, std::string_view>) {
        return std::any(std::string(value));
    } else {
        return std::any(std::forward<T>(value));
    }
}

template<typename... A>
Arguments make_arguments(A&&... args) {
    Arguments packed;
    packed.reserve(sizeof...(A));
    (packed.push_back(to_argument(std::forward<A>(args))), ...);
    return packed;
}

/// Extract argument `index` as `T`, raising a ListenerError on mismatch
template<typename T>
const std::remove_cvref_t<T>& argument_at(const Arguments& args, std::size_t index) {
    using D = std::remove_cvref_t<T>;
    if (index >= args.size()) {
        throw herald_core::Exception(herald_core::ListenerError::missing_argument(index, args.size()));
    }
    const auto* value = std::any_cast<D>(&args[index]);
    if (!value) {
        throw herald_core::Exception(herald_core::ListenerError::argument_type(index, typeid(D).name()));
    }
    return *value;
}

template<typename... A, typename F, std::size_t... Is>
void invoke_typed(F& fn, const Context& self, const Arguments& args, std::index_sequence<Is...>) {
    if constexpr (std::is_invocable_v<F&, const Context&, const std::remove_cvref_t<A>&...>) {
        fn(self, argument_at<A>(args, Is)...);
    } else {
        fn(argument_at<A>(args, Is)...);
    }
}

template<typename T>
struct is_std_function : std::false_type {};

template<typename S>
struct is_std_function<std::function<S>> : std::true_type {};

/// True for a null function pointer or an empty std::function
template<typename F>
bool is_empty_callable(const F& fn) noexcept {
    using D = std::remove_cvref_t<F>;
    if constexpr (std::is_pointer_v<D> || std::is_member_pointer_v<D>) {
        return fn == nullptr;
    } else if constexpr (is_std_function<D>::value) {
        return !fn;
    } else {
        return false;
    }
}

} // namespace detail

// =============================================================================
// Listener
// =============================================================================

/// Raw listener signature
using Callback = std::function<void(const Context&, const Arguments&)>;

/// Callables a Listener can wrap directly
template<typename F>
concept ListenerCallable =
    !std::is_same_v<std::remove_cvref_t<F>, Listener> &&
    (std::is_invocable_v<F&, const Context&, const Arguments&> ||
     std::is_invocable_v<F&, const Arguments&> ||
     std::is_invocable_v<F&>);

/// Shared handle to a callback
///
/// Copies share the callback and compare equal. Wrapping the same callable
/// twice yields two distinct listeners. A default-constructed listener, or
/// one wrapping a null function pointer or an empty std::function, is not
/// invocable.
class Listener {
public:
    Listener() noexcept = default;

    /// Wrap a callable taking `(const Context&, const Arguments&)`,
    /// `(const Arguments&)` or nothing
    template<ListenerCallable F>
    Listener(F&& fn) : m_callback(wrap(std::forward<F>(fn))) {}

    /// Wrap a callable taking typed arguments `(A...)` or
    /// `(const Context&, A...)`; arguments are taken from the emit pack by
    /// exact type
    template<typename... A, typename F>
    [[nodiscard]] static Listener typed(F&& fn) {
        if (detail::is_empty_callable(fn)) {
            return Listener{};
        }
        Callback callback = [f = std::forward<F>(fn)](const Context& self, const Arguments& args) mutable {
            detail::invoke_typed<A...>(f, self, args, std::index_sequence_for<A...>{});
        };
        Listener listener;
        listener.m_callback = std::make_shared<const Callback>(std::move(callback));
        return listener;
    }

    [[nodiscard]] bool is_invocable() const noexcept { return m_callback != nullptr; }
    explicit operator bool() const noexcept { return is_invocable(); }

    /// Invoke with a receiver and arguments
    void operator()(const Context& self, const Arguments& args) const {
        if (!m_callback) {
            throw herald_core::Exception(herald_core::ListenerError::not_invocable());
        }
        (*m_callback)(self, args);
    }

    /// Identity comparison
    bool operator==(const Listener& other) const noexcept { return m_callback == other.m_callback; }
    bool operator!=(const Listener& other) const noexcept { return m_callback != other.m_callback; }

private:
    template<typename F>
    static std::shared_ptr<const Callback> wrap(F&& fn) {
        if (detail::is_empty_callable(fn)) {
            return nullptr;
        }

        using D = std::remove_cvref_t<F>;
        if constexpr (std::is_same_v<D, Callback>) {
            return std::make_shared<const Callback>(std::forward<F>(fn));
        } else if constexpr (std::is_invocable_v<F&, const Context&, const Arguments&>) {
            return std::make_shared<const Callback>(Callback(std::forward<F>(fn)));
        } else if constexpr (std::is_invocable_v<F&, const Arguments&>) {
            return std::make_shared<const Callback>(
                [f = std::forward<F>(fn)](const Context&, const Arguments& args) mutable { f(args); });
        } else {
            return std::make_shared<const Callback>(
                [f = std::forward<F>(fn)](const Context&, const Arguments&) mutable { f(); });
        }
    }

    std::shared_ptr<const Callback> m_callback;
};

// =============================================================================
// ListenerRecord
// =============================================================================

/// One registration of a listener under an event key
///
/// An empty context stands for the owning emitter, which is supplied as
/// `fallback` when the record is used.
struct ListenerRecord {
    Listener listener;
    Context context;
    bool once = false;

    /// Receiver for an invocation
    [[nodiscard]] const Context& receiver(const Context& fallback) const noexcept {
        return context ? context : fallback;
    }

    /// Removal predicate: same listener, and same receiver when `ctx` is
    /// given, and a once record when `once_only` is set
    [[nodiscard]] bool matches(const Listener& target, const Context& ctx, bool once_only,
                               const Context& fallback) const noexcept {
        if (listener != target) return false;
        if (once_only && !once) return false;
        if (ctx && receiver(fallback) != ctx) return false;
        return true;
    }
};

using RecordPtr = std::shared_ptr<const ListenerRecord>;

} // namespace herald_event
