/// @file test_listener.cpp
/// @brief Tests for Listener, Context and argument packing

#include <catch2/catch_test_macros.hpp>
#include <herald/event/listener.hpp>

#include <functional>
#include <string>
#include <vector>

using namespace herald_event;

namespace {

struct Receiver {
    int value = 0;
};

void free_function() {}

} // namespace

TEST_CASE("Listener: invocability", "[event][listener]") {
    SECTION("default listener is not invocable") {
        Listener listener;
        REQUIRE_FALSE(listener.is_invocable());
        REQUIRE_THROWS_AS(listener(Context{}, Arguments{}), herald_core::Exception);
    }

    SECTION("empty std::function is not invocable") {
        Callback empty;
        Listener listener(empty);
        REQUIRE_FALSE(listener.is_invocable());
    }

    SECTION("null function pointer is not invocable") {
        void (*fn)() = nullptr;
        Listener listener(fn);
        REQUIRE_FALSE(listener.is_invocable());
    }

    SECTION("empty std::function of any call form is not invocable") {
        std::function<void()> no_args;
        std::function<void(const Arguments&)> args_only;
        REQUIRE_FALSE(Listener(no_args).is_invocable());
        REQUIRE_FALSE(Listener(args_only).is_invocable());
    }

    SECTION("typed listener over an empty callable is not invocable") {
        void (*fn)(int) = nullptr;
        std::function<void(int)> empty;
        REQUIRE_FALSE(Listener::typed<int>(fn).is_invocable());
        REQUIRE_FALSE(Listener::typed<int>(empty).is_invocable());
        REQUIRE_THROWS_AS(Listener::typed<int>(fn)(Context{}, Arguments{1}), herald_core::Exception);
    }

    SECTION("lambdas and function pointers are invocable") {
        REQUIRE(Listener([] {}).is_invocable());
        REQUIRE(Listener(&free_function).is_invocable());
        REQUIRE(Listener([](const Arguments&) {}).is_invocable());
        REQUIRE(Listener([](const Context&, const Arguments&) {}).is_invocable());
    }
}

TEST_CASE("Listener: identity", "[event][listener]") {
    auto fn = [] {};
    Listener a(fn);
    Listener b(fn);
    Listener a_copy = a;

    REQUIRE(a == a_copy);
    REQUIRE(a != b);
    REQUIRE(Listener() == Listener());
}

TEST_CASE("Listener: raw call forms", "[event][listener]") {
    int calls = 0;
    std::size_t seen_args = 0;

    Listener nullary([&calls] { ++calls; });
    Listener with_args([&seen_args](const Arguments& args) { seen_args = args.size(); });

    Arguments args = detail::make_arguments(1, 2, 3);
    nullary(Context{}, args);
    with_args(Context{}, args);

    REQUIRE(calls == 1);
    REQUIRE(seen_args == 3);
}

TEST_CASE("Listener: typed arguments", "[event][listener]") {
    SECTION("values are extracted by type") {
        int got_int = 0;
        std::string got_string;
        auto listener = Listener::typed<int, std::string>([&](int i, const std::string& s) {
            got_int = i;
            got_string = s;
        });

        listener(Context{}, detail::make_arguments(7, "seven"));
        REQUIRE(got_int == 7);
        REQUIRE(got_string == "seven");
    }

    SECTION("receiver can be taken first") {
        Receiver receiver{5};
        int seen = 0;
        auto listener = Listener::typed<int>([&seen](const Context& self, int delta) {
            seen = self.get<Receiver>()->value + delta;
        });

        listener(Context::of(receiver), detail::make_arguments(10));
        REQUIRE(seen == 15);
    }

    SECTION("missing argument raises") {
        auto listener = Listener::typed<int, int>([](int, int) {});
        try {
            listener(Context{}, detail::make_arguments(1));
            FAIL("expected an exception");
        } catch (const herald_core::Exception& e) {
            REQUIRE(e.code() == herald_core::ErrorCode::InvalidArgument);
            REQUIRE(e.error().as<herald_core::ListenerError>()->kind ==
                    herald_core::ListenerError::Kind::MissingArgument);
        }
    }

    SECTION("wrong type raises") {
        auto listener = Listener::typed<int>([](int) {});
        try {
            listener(Context{}, detail::make_arguments(std::string("one")));
            FAIL("expected an exception");
        } catch (const herald_core::Exception& e) {
            REQUIRE(e.error().as<herald_core::ListenerError>()->kind ==
                    herald_core::ListenerError::Kind::ArgumentType);
        }
    }

    SECTION("mutable callables keep their state") {
        int total = 0;
        auto listener = Listener::typed<int>([sum = 0, &total](int v) mutable {
            sum += v;
            total = sum;
        });
        listener(Context{}, detail::make_arguments(2));
        listener(Context{}, detail::make_arguments(3));
        REQUIRE(total == 5);
    }
}

TEST_CASE("make_arguments: string normalization", "[event][listener]") {
    const char* c_string = "c";
    std::string_view view = "view";
    Arguments args = detail::make_arguments("literal", c_string, view, std::string("owned"), 4.5);

    REQUIRE(args.size() == 5);
    REQUIRE(std::any_cast<std::string>(args[0]) == "literal");
    REQUIRE(std::any_cast<std::string>(args[1]) == "c");
    REQUIRE(std::any_cast<std::string>(args[2]) == "view");
    REQUIRE(std::any_cast<std::string>(args[3]) == "owned");
    REQUIRE(std::any_cast<double>(args[4]) == 4.5);
}

TEST_CASE("Context: identity and typed access", "[event][listener]") {
    Receiver a;
    Receiver b;
    const Receiver frozen{3};

    SECTION("empty context") {
        Context none;
        REQUIRE_FALSE(none.has_value());
        REQUIRE(none.get<Receiver>() == nullptr);
    }

    SECTION("same object compares equal") {
        REQUIRE(Context::of(a) == Context::of(a));
        REQUIRE(Context::of(a) != Context::of(b));
        REQUIRE(Context::of(a) != Context{});
    }

    SECTION("type mismatch yields nullptr") {
        auto ctx = Context::of(a);
        REQUIRE(ctx.get<Receiver>() == &a);
        REQUIRE(ctx.get<int>() == nullptr);
    }

    SECTION("const receivers are read-only") {
        auto ctx = Context::of(frozen);
        REQUIRE(ctx.get<Receiver>() == nullptr);
        REQUIRE(ctx.get<const Receiver>() == &frozen);
    }
}

TEST_CASE("ListenerRecord: removal predicate", "[event][listener]") {
    Receiver owner;
    Receiver other;
    Listener fn([] {});
    Listener different([] {});
    const Context fallback = Context::of(owner);

    ListenerRecord plain{fn, Context{}, false};
    ListenerRecord bound{fn, Context::of(other), true};

    REQUIRE(plain.matches(fn, Context{}, false, fallback));
    REQUIRE_FALSE(plain.matches(different, Context{}, false, fallback));

    SECTION("context filter") {
        REQUIRE(plain.matches(fn, Context::of(owner), false, fallback));
        REQUIRE_FALSE(plain.matches(fn, Context::of(other), false, fallback));
        REQUIRE(bound.matches(fn, Context::of(other), false, fallback));
    }

    SECTION("once filter") {
        REQUIRE_FALSE(plain.matches(fn, Context{}, true, fallback));
        REQUIRE(bound.matches(fn, Context{}, true, fallback));
    }

    SECTION("receiver falls back to owner") {
        REQUIRE(plain.receiver(fallback) == fallback);
        REQUIRE(bound.receiver(fallback) == Context::of(other));
    }
}
