#include <rstore/util/emitter.h>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace rstore;

TEST_CASE("Emitter - listeners receive payloads in registration order", "[emitter]") {
    Emitter<int> emitter;
    std::vector<std::string> calls;

    auto first = emitter.on([&](const int &v) { calls.push_back("a" + std::to_string(v)); });
    auto second = emitter.on([&](const int &v) { calls.push_back("b" + std::to_string(v)); });
    REQUIRE(emitter.size() == 2);

    emitter.emit(1);
    REQUIRE(calls == std::vector<std::string>{"a1", "b1"});

    first();
    first();
    REQUIRE(emitter.size() == 1);

    emitter.emit(2);
    REQUIRE(calls == std::vector<std::string>{"a1", "b1", "b2"});
}

TEST_CASE("Emitter - the same shared listener is registered once", "[emitter]") {
    Emitter<> emitter;
    int count = 0;
    auto listener = std::make_shared<const std::function<void()> >([&] { ++count; });

    emitter.on(listener);
    emitter.on(listener);
    emitter.emit();
    REQUIRE(count == 1);
}

TEST_CASE("Emitter - emit_and_clear drops every listener", "[emitter]") {
    Emitter<> emitter;
    int count = 0;
    emitter.on([&] { ++count; });
    emitter.on([&] { ++count; });

    emitter.emit_and_clear();
    REQUIRE(count == 2);
    REQUIRE(emitter.empty());

    emitter.emit();
    REQUIRE(count == 2);
}

TEST_CASE("Emitter - lifo emission runs the newest listener first", "[emitter]") {
    Emitter<> emitter;
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) { emitter.on([&order, i] { order.push_back(i); }); }

    emitter.emit_lifo();
    REQUIRE(order == std::vector<int>{2, 1, 0});
    REQUIRE(emitter.size() == 3);

    order.clear();
    emitter.emit_and_clear_lifo();
    REQUIRE(order == std::vector<int>{2, 1, 0});
    REQUIRE(emitter.empty());
}

TEST_CASE("Emitter - settled emitters call late listeners immediately", "[emitter]") {
    Emitter<std::string> emitter;
    std::vector<std::string> seen;
    emitter.on([&](const std::string &v) { seen.push_back(v); });

    emitter.settle("done");
    REQUIRE(emitter.settled());
    REQUIRE(seen == std::vector<std::string>{"done"});

    emitter.emit("ignored");
    emitter.on([&](const std::string &v) { seen.push_back("late:" + v); });
    REQUIRE(seen == std::vector<std::string>{"done", "late:done"});
}

TEST_CASE("Emitter - mapped listeners filter payloads", "[emitter]") {
    Emitter<int> emitter;
    std::vector<int> evens;
    emitter.on([](const int &v) -> std::optional<int> {
                   if (v % 2 == 0) { return v * 10; }
                   return std::nullopt;
               },
               [&](int v) { evens.push_back(v); });

    for (int i = 1; i <= 4; ++i) { emitter.emit(i); }
    REQUIRE(evens == std::vector<int>{20, 40});
}

TEST_CASE("Emitter - a listener may unsubscribe others during emission", "[emitter]") {
    Emitter<> emitter;
    int second_calls = 0;
    Unsubscribe second;
    emitter.on([&] { second(); });
    second = emitter.on([&] { ++second_calls; });

    emitter.emit();
    emitter.emit();
    REQUIRE(second_calls == 1);
    REQUIRE(emitter.size() == 1);
}
