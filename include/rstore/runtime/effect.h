#pragma once

/**
 * @file effect.h
 * @brief Tracked computations that re-run when the state they read changes.
 *
 * An effect records every read made while it runs and subscribes to each dependency it did not itself write. A
 * change re-runs it through schedule_notification, so a batch() coalesces re-runs. Runs never nest: a write made
 * by an effect that would re-trigger the same effect is ignored while it is running.
 */

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/runtime/effect_options.h>
#include <rstore/util/emitter.h>
#include <rstore/util/errors.h>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace rstore {

    /**
     * Cooperative cancellation signal. Once cancelled it stays cancelled and listeners registered afterwards are
     * called immediately.
     */
    class RSTORE_EXPORT CancellationToken {
    public:
        [[nodiscard]] bool cancelled() const { return _cancelled.settled(); }

        Unsubscribe on_cancel(std::function<void()> listener) { return _cancelled.on(std::move(listener)); }

        void cancel() { _cancelled.settle(); }

    private:
        Emitter<> _cancelled;
    };

    using cancellation_token_ptr = std::shared_ptr<CancellationToken>;

    namespace detail {
        /**
         * State of one effect run. Becomes stale when the next run starts or the effect is disposed, at which point
         * the token is cancelled and the cleanups run in reverse registration order.
         */
        struct RSTORE_EXPORT EffectRun {
            explicit EffectRun(std::size_t nth) : nth{nth} {}

            void run_cleanups();

            std::size_t nth;
            bool stale{false};
            cancellation_token_ptr token;
            Emitter<> cleanups;
        };
    } // namespace detail

    /**
     * Handle to the current run, passed to the effect body. Copies refer to the same run and may outlive it.
     */
    class RSTORE_EXPORT EffectContext {
    public:
        explicit EffectContext(std::shared_ptr<detail::EffectRun> run) : _run{std::move(run)} {}

        // 1-based run number; usable as a staleness token for deferred work.
        [[nodiscard]] std::size_t nth() const { return _run->nth; }

        [[nodiscard]] bool is_stale() const { return _run->stale; }

        // Created on first use; cancelled when this run goes stale.
        [[nodiscard]] cancellation_token_ptr cancellation();

        /**
         * Register a cleanup, run before the next run or on disposal. Returns a function removing it again.
         */
        Unsubscribe on_cleanup(std::function<void()> cleanup);

        /**
         * Wrap a callback so that it does nothing once this run is stale. A non-void result comes back as an
         * optional, empty when the call was skipped.
         */
        template<typename F>
        auto safe(F fn) const {
            return [run = _run, fn = std::move(fn)](auto &&... args) mutable {
                using result_t = std::invoke_result_t<F &, decltype(args)...>;
                if constexpr (std::is_void_v<result_t>) {
                    if (!run->stale) { std::invoke(fn, std::forward<decltype(args)>(args)...); }
                } else {
                    if (run->stale) { return std::optional<result_t>{}; }
                    return std::optional<result_t>{std::invoke(fn, std::forward<decltype(args)>(args)...)};
                }
            };
        }

    private:
        std::shared_ptr<detail::EffectRun> _run;
    };

    using EffectBody = std::function<void(EffectContext &)>;

    template<typename T>
    struct is_async_result : std::false_type {};

    template<typename T>
    struct is_async_result<std::future<T> > : std::true_type {};

    template<typename T>
    struct is_async_result<std::shared_future<T> > : std::true_type {};

    template<typename T>
    inline constexpr bool is_async_result_v = is_async_result<std::remove_cvref_t<T> >::value;

    namespace detail {
        RSTORE_EXPORT Unsubscribe start_effect(EffectBody body, EffectOptions options);

        template<typename Fn>
        EffectBody make_effect_body(Fn fn) {
            if constexpr (std::is_invocable_v<Fn &, EffectContext &>) {
                using result_t = std::invoke_result_t<Fn &, EffectContext &>;
                static_assert(std::is_void_v<result_t> || is_async_result_v<result_t>,
                              "An effect body must not return a value");
                if constexpr (is_async_result_v<result_t>) {
                    return [fn = std::move(fn)](EffectContext &ctx) mutable {
                        auto pending = fn(ctx);
                        static_cast<void>(pending);
                        throw AsyncFunctionError(
                            "Effect function",
                            "Use ctx.safe() or the cancellation token for async work instead of returning a future.");
                    };
                } else {
                    return EffectBody{std::move(fn)};
                }
            } else {
                static_assert(std::is_invocable_v<Fn &>, "An effect body takes an EffectContext& or nothing");
                return make_effect_body([fn = std::move(fn)](EffectContext &) mutable -> decltype(auto) {
                    return fn();
                });
            }
        }
    } // namespace detail

    /**
     * Create an effect. It starts through the current hooks: immediately at top level, or once the owning store's
     * setup returns when called from a setup function. The returned function disposes it.
     */
    template<typename Fn>
    Unsubscribe effect(Fn fn, EffectOptions options = {}) {
        return detail::start_effect(detail::make_effect_body(std::move(fn)), std::move(options));
    }

} // namespace rstore
