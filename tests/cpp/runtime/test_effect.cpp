#include <rstore/runtime/clock.h>
#include <rstore/runtime/effect.h>
#include <rstore/runtime/hooks.h>
#include <rstore/util/errors.h>

#include "../log_capture.h"
#include "../store_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rstore;
using rstore::test::pair_spec;

namespace {
    struct EffectFixture {
        container_ptr container{Container::create()};
        instance_ptr instance{container->get(pair_spec())};

        void set(std::string_view key, int value) const { instance->actions()["set"](std::string{key}, value); }

        [[nodiscard]] int64_t get(std::string_view key) const {
            return untrack([&] { return instance->state().get(key).as_int(); });
        }
    };
}  // namespace

TEST_CASE("Effect - re-runs when a tracked property changes", "[effect]") {
    EffectFixture f;
    int runs = 0;
    int64_t seen = -1;

    auto dispose = effect([&] {
        seen = f.instance->state().get("a").as_int();
        ++runs;
    });
    REQUIRE(runs == 1);
    REQUIRE(seen == 0);

    f.set("a", 5);
    REQUIRE(runs == 2);
    REQUIRE(seen == 5);

    f.set("b", 1);
    REQUIRE(runs == 2);

    f.set("a", 5);
    REQUIRE(runs == 2);

    dispose();
    f.set("a", 6);
    REQUIRE(runs == 2);
}

TEST_CASE("Effect - its own writes do not re-trigger it", "[effect]") {
    EffectFixture f;
    int runs = 0;

    auto dispose = effect([&] {
        auto a = f.instance->state().get("a").as_int();
        f.set("a", static_cast<int>(a) + 1);
        static_cast<void>(f.instance->state().get("b"));
        ++runs;
    });
    REQUIRE(runs == 1);
    REQUIRE(f.get("a") == 1);

    f.set("b", 10);
    REQUIRE(runs == 2);
    REQUIRE(f.get("a") == 2);

    f.set("a", 100);
    REQUIRE(runs == 2);
    REQUIRE(f.get("a") == 100);

    dispose();
}

TEST_CASE("Effect - subscriptions follow the properties each run writes", "[effect]") {
    EffectFixture f;
    int runs = 0;

    // Resets a only while b is zero; reads both every run.
    auto dispose = effect([&] {
        ++runs;
        auto mode = f.instance->state().get("b").as_int();
        static_cast<void>(f.instance->state().get("a"));
        if (mode == 0) { f.set("a", 0); }
    });
    REQUIRE(runs == 1);

    f.set("a", 4);
    REQUIRE(runs == 1);

    f.set("b", 1);
    REQUIRE(runs == 2);

    // The last run only read a, so a write to it now re-runs the effect.
    f.set("a", 7);
    REQUIRE(runs == 3);

    f.set("b", 0);
    REQUIRE(runs == 4);
    REQUIRE(f.get("a") == 0);

    f.set("a", 3);
    REQUIRE(runs == 4);

    dispose();
}

TEST_CASE("Effect - cleanups run newest first before each re-run and on dispose", "[effect]") {
    EffectFixture f;
    std::vector<std::string> log;

    auto dispose = effect([&](EffectContext &ctx) {
        static_cast<void>(f.instance->state().get("a"));
        auto nth = ctx.nth();
        ctx.on_cleanup([&log, nth] { log.push_back(fmt::format("first{}", nth)); });
        ctx.on_cleanup([&log, nth] { log.push_back(fmt::format("second{}", nth)); });
    });
    REQUIRE(log.empty());

    f.set("a", 1);
    REQUIRE(log == std::vector<std::string>{"second1", "first1"});

    dispose();
    REQUIRE(log == std::vector<std::string>{"second1", "first1", "second2", "first2"});

    dispose();
    REQUIRE(log.size() == 4);
}

TEST_CASE("Effect - safe continuations are dropped once the run is stale", "[effect]") {
    EffectFixture f;
    std::function<void()> continuation;
    std::function<std::optional<int>(int)> compute;
    int applied = 0;

    auto dispose = effect([&](EffectContext &ctx) {
        static_cast<void>(f.instance->state().get("a"));
        if (ctx.nth() == 1) {
            continuation = ctx.safe([&applied] { ++applied; });
            compute = ctx.safe([](int x) { return x * 2; });
        }
    });

    continuation();
    REQUIRE(applied == 1);
    REQUIRE(compute(4) == 8);

    f.set("a", 1);
    continuation();
    REQUIRE(applied == 1);
    REQUIRE_FALSE(compute(4).has_value());

    dispose();
}

TEST_CASE("Effect - cancellation token is cancelled when the run goes stale", "[effect]") {
    EffectFixture f;
    cancellation_token_ptr first;
    int cancelled = 0;

    auto dispose = effect([&](EffectContext &ctx) {
        static_cast<void>(f.instance->state().get("a"));
        auto token = ctx.cancellation();
        if (!first) {
            first = token;
            token->on_cancel([&] { ++cancelled; });
        }
    });
    REQUIRE_FALSE(first->cancelled());

    f.set("a", 1);
    REQUIRE(first->cancelled());
    REQUIRE(cancelled == 1);

    // Late registrations on a cancelled token fire at once.
    first->on_cancel([&] { ++cancelled; });
    REQUIRE(cancelled == 2);

    dispose();
}

TEST_CASE("Effect - keepAlive logs the error and keeps the dependencies", "[effect][errors]") {
    test::LogCapture logs;
    EffectFixture f;
    int good_runs = 0;

    auto dispose = effect([&] {
        auto a = f.instance->state().get("a").as_int();
        if (a == 1) { throw std::runtime_error("bad value"); }
        ++good_runs;
    });
    REQUIRE(good_runs == 1);

    f.set("a", 1);
    REQUIRE(logs.count(LogLevel::ERROR) == 1);
    REQUIRE(logs.contains("Effect error (keepAlive): bad value"));

    f.set("a", 2);
    REQUIRE(good_runs == 2);
    REQUIRE(logs.count(LogLevel::ERROR) == 1);

    dispose();
}

TEST_CASE("Effect - failFast rethrows to the writer and goes inert", "[effect][errors]") {
    EffectFixture f;
    int runs = 0;

    auto dispose = effect([&] {
                              ++runs;
                              if (f.instance->state().get("a").as_int() == 1) { throw std::logic_error("fail"); }
                          },
                          EffectOptions{.on_error = FailFast{}});
    REQUIRE(runs == 1);

    REQUIRE_THROWS_AS(f.set("a", 1), std::logic_error);
    REQUIRE(runs == 2);

    f.set("a", 2);
    REQUIRE(runs == 2);

    dispose();
}

TEST_CASE("Effect - retry re-runs on the clock and logs after the last attempt", "[effect][errors]") {
    test::LogCapture logs;
    auto clock = std::make_shared<SimulationClock>();
    int attempts = 0;

    auto dispose = effect([&] {
                              ++attempts;
                              throw std::runtime_error("unavailable");
                          },
                          EffectOptions{
                              .on_error = RetryConfig{.max_retries = 2, .delay = milliseconds(10)},
                              .clock = clock,
                          });
    REQUIRE(attempts == 1);
    REQUIRE(clock->pending_alarms() == 1);

    clock->advance(milliseconds(9));
    REQUIRE(attempts == 1);
    clock->advance(milliseconds(1));
    REQUIRE(attempts == 2);

    clock->advance(milliseconds(10));
    REQUIRE(attempts == 3);
    REQUIRE(clock->pending_alarms() == 0);
    REQUIRE(logs.contains("Effect failed after 2 retries: unavailable"));

    dispose();
}

TEST_CASE("Effect - disposing cancels a pending retry", "[effect][errors]") {
    auto clock = std::make_shared<SimulationClock>();
    int attempts = 0;

    auto dispose = effect([&] {
                              ++attempts;
                              throw std::runtime_error("down");
                          },
                          EffectOptions{.on_error = RetryConfig{.max_retries = 5}, .clock = clock});
    REQUIRE(clock->pending_alarms() == 1);

    dispose();
    REQUIRE(clock->pending_alarms() == 0);
    clock->run_until_idle();
    REQUIRE(attempts == 1);
}

TEST_CASE("Effect - default retry backoff doubles from 100ms", "[effect][errors]") {
    RetryConfig config{.max_retries = 3};
    REQUIRE(retry_delay(config, 0) == milliseconds(100));
    REQUIRE(retry_delay(config, 1) == milliseconds(200));
    REQUIRE(retry_delay(config, 3) == milliseconds(800));

    RetryConfig custom{.max_retries = 3, .delay = RetryDelayFn{[](std::size_t n) { return milliseconds(5 * n); }}};
    REQUIRE(retry_delay(custom, 2) == milliseconds(10));
}

TEST_CASE("Effect - a custom handler owns recovery", "[effect][errors]") {
    std::vector<EffectErrorContext> errors;
    int attempts = 0;

    auto dispose = effect([&] {
                              ++attempts;
                              if (attempts < 3) { throw std::runtime_error("flaky"); }
                          },
                          EffectOptions{
                              .on_error = EffectErrorHandler{[&](const EffectErrorContext &ctx) { errors.push_back(ctx); }},
                          });
    REQUIRE(attempts == 1);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].retry_count == 0);
    REQUIRE(describe_exception(errors[0].error) == "flaky");

    // Copy the callback: the retry appends to errors.
    auto retry = errors[0].retry;
    retry();
    REQUIRE(attempts == 2);
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[1].retry_count == 1);

    retry = errors[1].retry;
    retry();
    REQUIRE(attempts == 3);
    REQUIRE(errors.size() == 2);

    dispose();
}

TEST_CASE("Effect - returning a future is rejected", "[effect][errors]") {
    REQUIRE_THROWS_AS(effect([] {
        std::promise<void> promise;
        promise.set_value();
        return promise.get_future();
    }), AsyncFunctionError);
}
