/// @file test_dispatch.cpp
/// @brief Tests for Emitter::emit ordering, arguments and re-entrancy

#include <catch2/catch_test_macros.hpp>
#include <herald/event/emitter.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace herald_event;

namespace {

struct Counter {
    int value = 0;
};

} // namespace

TEST_CASE("Dispatch: return value", "[event][dispatch]") {
    Emitter emitter;

    SECTION("false without listeners") {
        REQUIRE_FALSE(emitter.emit("nothing"));
        REQUIRE_FALSE(emitter.emit("nothing", 1, 2, 3));
    }

    SECTION("true with listeners") {
        emitter.on("event", [] {});
        REQUIRE(emitter.emit("event"));
    }

    SECTION("true when a once listener empties the key") {
        emitter.once("event", [] {});
        REQUIRE(emitter.emit("event"));
        REQUIRE(emitter.listener_count("event") == 0);
        REQUIRE_FALSE(emitter.emit("event"));
    }
}

TEST_CASE("Dispatch: registration order", "[event][dispatch]") {
    Emitter emitter;
    std::vector<std::string> order;

    emitter.on("e", [&order] { order.push_back("a"); });
    emitter.once("e", [&order] { order.push_back("b"); });
    emitter.on("e", [&order] { order.push_back("c"); });

    emitter.emit("e");
    emitter.emit("e");

    REQUIRE(order == std::vector<std::string>{"a", "b", "c", "a", "c"});
    REQUIRE(emitter.listener_count("e") == 2);
}

TEST_CASE("Dispatch: once listener fires once", "[event][dispatch]") {
    Emitter emitter;
    std::vector<int> received;
    emitter.once("x", Listener::typed<int>([&received](int v) { received.push_back(v); }));

    REQUIRE(emitter.emit("x", 1));
    REQUIRE_FALSE(emitter.emit("x", 2));

    REQUIRE(received == std::vector<int>{1});
    REQUIRE(emitter.event_names().empty());
}

TEST_CASE("Dispatch: arguments", "[event][dispatch]") {
    Emitter emitter;

    SECTION("typed arguments in order") {
        int id = 0;
        std::string name;
        emitter.on("data", Listener::typed<int, std::string>([&](int i, const std::string& n) {
            id = i;
            name = n;
        }));
        emitter.emit("data", 1, "John");
        REQUIRE(id == 1);
        REQUIRE(name == "John");
    }

    SECTION("more than five arguments") {
        std::vector<int> seen;
        emitter.on("many", Listener::typed<int, int, int, int, int, int, int>(
            [&seen](int a, int b, int c, int d, int e, int f, int g) {
                seen = {a, b, c, d, e, f, g};
            }));
        emitter.emit("many", 1, 2, 3, 4, 5, 6, 7);
        REQUIRE(seen == std::vector<int>{1, 2, 3, 4, 5, 6, 7});
    }

    SECTION("raw listeners see the whole pack") {
        std::size_t count = 0;
        emitter.on("raw", [&count](const Arguments& args) { count = args.size(); });
        emitter.emit("raw", 1, 2.5, std::string("three"));
        REQUIRE(count == 3);
    }

    SECTION("a prepared pack") {
        double total = 0.0;
        emitter.on("sum", Listener::typed<double, double>([&total](double a, double b) { total = a + b; }));
        Arguments args{1.5, 2.5};
        REQUIRE(emitter.emit_args("sum", args));
        REQUIRE(total == 4.0);
    }

    SECTION("every listener receives the same arguments") {
        std::vector<std::string> seen;
        auto fn = Listener::typed<std::string>([&seen](const std::string& s) { seen.push_back(s); });
        emitter.on("msg", fn).on("msg", fn);
        emitter.emit("msg", "hi");
        REQUIRE(seen == std::vector<std::string>{"hi", "hi"});
    }

    SECTION("mismatched argument type raises") {
        emitter.on("typed", Listener::typed<int>([](int) {}));
        REQUIRE_THROWS_AS(emitter.emit("typed", "not a number"), herald_core::Exception);
    }
}

TEST_CASE("Dispatch: receiver", "[event][dispatch]") {
    Emitter emitter;

    SECTION("defaults to the emitter") {
        const Emitter* seen = nullptr;
        emitter.on("who", Listener::typed<>([&seen](const Context& self) {
            seen = self.get<Emitter>();
        }));
        emitter.emit("who");
        REQUIRE(seen == &emitter);
    }

    SECTION("custom context") {
        Counter counter;
        emitter.on("inc", Listener::typed<int>([](const Context& self, int by) {
            self.get<Counter>()->value += by;
        }), Context::of(counter));
        emitter.emit("inc", 3);
        emitter.emit("inc", 4);
        REQUIRE(counter.value == 7);
    }
}

TEST_CASE("Dispatch: listener exceptions propagate", "[event][dispatch]") {
    Emitter emitter;
    bool later_ran = false;

    emitter.on("boom", [] { throw std::runtime_error("boom"); });
    emitter.on("boom", [&later_ran] { later_ran = true; });

    REQUIRE_THROWS_AS(emitter.emit("boom"), std::runtime_error);
    REQUIRE_FALSE(later_ran);
    REQUIRE(emitter.listener_count("boom") == 2);

    SECTION("a throwing once listener is still consumed") {
        Emitter other;
        other.once("fail", [] { throw std::runtime_error("fail"); });
        REQUIRE_THROWS_AS(other.emit("fail"), std::runtime_error);
        REQUIRE(other.listener_count("fail") == 0);
    }
}

TEST_CASE("Dispatch: mutation while dispatching", "[event][dispatch]") {
    Emitter emitter;

    SECTION("removing a later listener does not skip it") {
        int later_calls = 0;
        Listener later([&later_calls] { ++later_calls; });
        emitter.on("e", [&emitter, &later] { emitter.off("e", later); });
        emitter.on("e", later);

        emitter.emit("e");
        REQUIRE(later_calls == 1);
        REQUIRE(emitter.listener_count("e") == 1);

        emitter.emit("e");
        REQUIRE(later_calls == 1);
    }

    SECTION("added listeners wait for the next emit") {
        int added_calls = 0;
        Listener added([&added_calls] { ++added_calls; });
        bool registered = false;
        emitter.on("e", [&] {
            if (!registered) {
                registered = true;
                emitter.on("e", added);
            }
        });

        emitter.emit("e");
        REQUIRE(added_calls == 0);
        REQUIRE(emitter.listener_count("e") == 2);

        emitter.emit("e");
        REQUIRE(added_calls == 1);
    }

    SECTION("remove_all_listeners from inside a listener") {
        int calls = 0;
        emitter.on("e", [&emitter] { emitter.remove_all_listeners(); });
        emitter.on("e", [&calls] { ++calls; });

        REQUIRE(emitter.emit("e"));
        REQUIRE(calls == 1);
        REQUIRE(emitter.empty());
    }

    SECTION("a removed once listener is skipped") {
        int once_calls = 0;
        Listener once_fn([&once_calls] { ++once_calls; });
        emitter.on("e", [&emitter, &once_fn] { emitter.off("e", once_fn); });
        emitter.once("e", once_fn);

        emitter.emit("e");
        REQUIRE(once_calls == 0);
    }
}

TEST_CASE("Dispatch: re-entrant emit", "[event][dispatch]") {
    Emitter emitter;

    SECTION("once listener does not fire twice") {
        int once_calls = 0;
        int depth = 0;
        emitter.on("e", [&] {
            if (depth++ == 0) {
                emitter.emit("e");
            }
        });
        emitter.once("e", [&once_calls] { ++once_calls; });

        emitter.emit("e");
        REQUIRE(once_calls == 1);
        REQUIRE(emitter.listener_count("e") == 1);
    }

    SECTION("once listener no longer sees itself") {
        int calls = 0;
        bool nested_result = true;
        emitter.once("self", [&] {
            ++calls;
            nested_result = emitter.emit("self");
        });

        REQUIRE(emitter.emit("self"));
        REQUIRE(calls == 1);
        REQUIRE_FALSE(nested_result);
    }

    SECTION("emitting another key") {
        std::vector<std::string> order;
        emitter.on("outer", [&] {
            order.push_back("outer");
            emitter.emit("inner");
        });
        emitter.on("inner", [&order] { order.push_back("inner"); });

        emitter.emit("outer");
        REQUIRE(order == std::vector<std::string>{"outer", "inner"});
    }
}

TEST_CASE("Dispatch: symbol keys", "[event][dispatch]") {
    Emitter emitter;
    auto ready = Symbol::create("ready");
    std::string received;

    emitter.once(ready, Listener::typed<std::string>([&received](const std::string& s) { received = s; }));

    REQUIRE(emitter.emit(ready, "go"));
    REQUIRE(received == "go");
    REQUIRE_FALSE(emitter.emit(ready, "again"));
}

TEST_CASE("Dispatch: greet receives the emitter and its argument", "[event][dispatch]") {
    Emitter emitter;
    const Emitter* receiver = nullptr;
    std::string name;

    emitter.on("greet", Listener::typed<std::string>([&](const Context& self, const std::string& who) {
        receiver = self.get<Emitter>();
        name = who;
    }));

    REQUIRE(emitter.emit("greet", "Alice"));
    REQUIRE(receiver == &emitter);
    REQUIRE(name == "Alice");
}
