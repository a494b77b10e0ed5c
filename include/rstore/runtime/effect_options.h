#pragma once

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/util/date_time.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <variant>

namespace rstore {

    /**
     * Passed to a custom effect error handler. Calling retry() re-runs the effect and increments retry_count; the
     * handler is invoked while the failed run is still unwinding, so a retry must be deferred (for example through a
     * clock alarm) to take effect.
     */
    struct EffectErrorContext {
        std::exception_ptr error;
        std::function<void()> retry;
        std::size_t retry_count{0};
    };

    using RetryDelayFn = std::function<engine_time_delta_t(std::size_t attempt)>;

    /**
     * Timer based re-run. Without a delay the backoff is 100ms * 2^attempt.
     */
    struct RetryConfig {
        std::size_t max_retries{0};
        std::variant<std::monostate, engine_time_delta_t, RetryDelayFn> delay;
    };

    // Rethrow to the caller that triggered the run; the effect goes inert.
    struct FailFast {};

    // Log and stay subscribed to the last good dependency set.
    struct KeepAlive {};

    using EffectErrorHandler = std::function<void(const EffectErrorContext &)>;

    using EffectErrorStrategy = std::variant<KeepAlive, FailFast, RetryConfig, EffectErrorHandler>;

    [[nodiscard]] RSTORE_EXPORT engine_time_delta_t retry_delay(const RetryConfig &config, std::size_t attempt);

    struct EffectOptions {
        std::optional<EffectErrorStrategy> on_error;
        // Timer source for retries; falls back to the owning container's clock, then default_clock().
        clock_s_ptr clock;
    };

    /**
     * What the owner of an effect (a store during setup) hands to it when starting it.
     */
    struct RunEffectOptions {
        // Called for every error before the strategy is applied.
        std::function<void(std::exception_ptr)> on_error;
        // Used when the effect itself does not name a strategy.
        std::optional<EffectErrorStrategy> default_strategy;
        clock_s_ptr clock;
    };

    // Starts an effect and returns its disposer.
    using EffectRunner = std::function<Unsubscribe(const RunEffectOptions &)>;

} // namespace rstore
