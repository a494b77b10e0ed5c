#include <rstore/runtime/hooks.h>
#include <rstore/runtime/trace_hooks.h>

#include "../log_capture.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace rstore;

namespace {
    ReadEvent read_event(std::string key) { return ReadEvent{.key = std::move(key)}; }

    struct RecordingHooks : HooksDelegate {
        using HooksDelegate::HooksDelegate;

        [[nodiscard]] bool tracks_reads() const override { return true; }

        void on_read(const ReadEvent &event) override { reads.push_back(event.key); }

        std::vector<std::string> reads;
    };
}  // namespace

TEST_CASE("Hooks - defaults track nothing and deliver immediately", "[hooks]") {
    REQUIRE_FALSE(is_tracking_reads());
    REQUIRE_FALSE(is_tracking_writes());

    int delivered = 0;
    schedule_notification([&] { ++delivered; });
    REQUIRE(delivered == 1);

    bool started = false;
    schedule_effect([&](const RunEffectOptions &) -> Unsubscribe {
        started = true;
        return [] {};
    });
    REQUIRE(started);
}

TEST_CASE("Hooks - with_hooks restores the previous hooks even on throw", "[hooks]") {
    auto &outer = current_hooks();
    RecordingHooks recorder{outer};

    REQUIRE_THROWS_AS(with_hooks(static_cast<Hooks &>(recorder), [&] {
        REQUIRE(&current_hooks() == &recorder);
        track_read(read_event("s:1.a"));
        throw std::runtime_error("boom");
    }), std::runtime_error);

    REQUIRE(&current_hooks() == &outer);
    REQUIRE(recorder.reads == std::vector<std::string>{"s:1.a"});
}

TEST_CASE("Hooks - a patch only replaces what it names", "[hooks]") {
    auto &outer = current_hooks();
    RecordingHooks recorder{outer};
    std::vector<std::string> writes;

    with_hooks(static_cast<Hooks &>(recorder), [&] {
        with_hooks(HookPatch{.on_write = [&](const WriteEvent &e) { writes.push_back(e.key); }}, [&] {
            REQUIRE(is_tracking_reads());
            REQUIRE(is_tracking_writes());
            track_read(read_event("s:1.a"));
            track_write(WriteEvent{.key = "s:1.b"});
        });
    });

    REQUIRE(recorder.reads == std::vector<std::string>{"s:1.a"});
    REQUIRE(writes == std::vector<std::string>{"s:1.b"});
}

TEST_CASE("Hooks - builder form calls through to the current hooks", "[hooks]") {
    auto &outer = current_hooks();
    RecordingHooks recorder{outer};
    std::vector<std::string> seen;

    with_hooks(static_cast<Hooks &>(recorder), [&] {
        with_hooks([&](Hooks &previous) {
                       return HookPatch{.on_read = [&seen, &previous](const ReadEvent &e) {
                           seen.push_back("patched:" + e.key);
                           previous.on_read(e);
                       }};
                   },
                   [] { track_read(read_event("s:1.x")); });
    });

    REQUIRE(seen == std::vector<std::string>{"patched:s:1.x"});
    REQUIRE(recorder.reads == std::vector<std::string>{"s:1.x"});
}

TEST_CASE("Hooks - untrack hides reads and writes", "[hooks]") {
    auto &outer = current_hooks();
    RecordingHooks recorder{outer};

    with_hooks(static_cast<Hooks &>(recorder), [&] {
        auto result = untrack([] {
            REQUIRE_FALSE(is_tracking_reads());
            track_read(read_event("hidden"));
            return 7;
        });
        REQUIRE(result == 7);
        track_read(read_event("visible"));
    });

    REQUIRE(recorder.reads == std::vector<std::string>{"visible"});
}

TEST_CASE("Hooks - batch delivers one notification per key at the end", "[hooks][batch]") {
    std::vector<std::string> delivered;
    int key_a = 0;
    int key_b = 0;

    batch([&] {
        schedule_notification([&] { delivered.push_back("a1"); }, &key_a);
        schedule_notification([&] { delivered.push_back("b1"); }, &key_b);
        schedule_notification([&] { delivered.push_back("a2"); }, &key_a);
        schedule_notification([&] { delivered.push_back("anon1"); });
        schedule_notification([&] { delivered.push_back("anon2"); });
        REQUIRE(delivered.empty());
    });

    REQUIRE(delivered == std::vector<std::string>{"a2", "b1", "anon1", "anon2"});
}

TEST_CASE("Hooks - batch flushes when the body throws", "[hooks][batch]") {
    int delivered = 0;
    int key = 0;

    REQUIRE_THROWS_AS(batch([&] {
        schedule_notification([&] { ++delivered; }, &key);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    REQUIRE(delivered == 1);
}

TEST_CASE("Hooks - nested batches flush at their own close", "[hooks][batch]") {
    std::vector<std::string> delivered;
    int key = 0;

    batch([&] {
        batch([&] { schedule_notification([&] { delivered.push_back("inner"); }, &key); });
        REQUIRE(delivered == std::vector<std::string>{"inner"});
        schedule_notification([&] { delivered.push_back("outer"); }, &key);
        REQUIRE(delivered.size() == 1);
    });

    REQUIRE(delivered == std::vector<std::string>{"inner", "outer"});
}

TEST_CASE("TraceHooks - logs filtered reads and writes at debug level", "[hooks][trace]") {
    test::LogCapture logs;

    with_trace([] {
        track_read(ReadEvent{.key = "cart:1.items", .value = Value(3)});
        track_read(ReadEvent{.key = "user:2.name", .value = Value("ann")});
        track_write(WriteEvent{.key = "cart:1.items", .next = Value(4), .prev = Value(3)});
    }, std::string{"cart"});

    REQUIRE(logs.count(LogLevel::DEBUG) == 2);
    REQUIRE(logs.contains("[trace] read  cart:1.items = 3"));
    REQUIRE(logs.contains("[trace] write cart:1.items: 3 -> 4"));
    REQUIRE_FALSE(logs.contains("user:2"));
}
