#pragma once

/**
 * @file pick.h
 * @brief Derived values tracked by their result instead of by the properties they read.
 *
 * pick() evaluates a selector in a private hook scope and registers a single virtual dependency with the enclosing
 * tracker. The enclosing effect is only notified when the selector's result changes under the given equality, not
 * every time one of the underlying properties does.
 */

#include <rstore/rstore_export.h>
#include <rstore/runtime/hooks.h>
#include <rstore/types/equality.h>
#include <rstore/util/emitter.h>
#include <rstore/util/errors.h>
#include <rstore/util/logging.h>

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rstore {

    template<typename T>
    using PickEquality = std::function<bool(const T &, const T &)>;

    namespace detail {
        [[nodiscard]] RSTORE_EXPORT std::string next_pick_key();

        template<typename T>
        PickEquality<T> default_pick_equality() {
            if constexpr (std::same_as<T, Value>) {
                return identical;
            } else {
                static_assert(std::equality_comparable<T>, "pick() needs an equality for this result type");
                return std::equal_to<T>{};
            }
        }

        template<typename Selector, typename R>
        struct PickState {
            PickState(Selector selector_, PickEquality<R> equality_)
                : selector{std::move(selector_)}, equality{std::move(equality_)} {}

            R evaluate() {
                reads.clear();
                return with_hooks(HookPatch{.on_read = [this](const ReadEvent &event) { reads.push_back(event); }},
                                  selector);
            }

            Selector selector;
            PickEquality<R> equality;
            std::optional<R> current;
            std::vector<ReadEvent> reads;
        };

        template<typename Selector, typename R>
        struct PickSubscription : std::enable_shared_from_this<PickSubscription<Selector, R> > {
            PickSubscription(std::shared_ptr<PickState<Selector, R> > state_, Notification listener_)
                : state{std::move(state_)}, listener{std::move(listener_)} {}

            void subscribe_reads() {
                for (const auto &read: state->reads) {
                    subscriptions.on(read.subscribe([self = this->shared_from_this()] { self->on_change(); }));
                }
            }

            void clear() { subscriptions.emit_and_clear(); }

            void on_change() {
                try {
                    auto previous = std::move(state->current);
                    clear();
                    state->current = state->evaluate();
                    subscribe_reads();
                    if (!previous || !state->equality(*previous, *state->current)) { listener(); }
                } catch (const std::exception &e) {
                    // The owner re-runs and meets the error itself.
                    log_debug("pick re-evaluation failed: {}", e.what());
                    clear();
                    listener();
                }
            }

            std::shared_ptr<PickState<Selector, R> > state;
            Notification listener;
            Emitter<> subscriptions;
        };
    } // namespace detail

    /**
     * Evaluate selector and return its result, registering it with the enclosing tracker as one dependency.
     * Throws HooksContextError when nothing is tracking reads. A selector that reads no state is returned as a
     * constant and registers nothing.
     */
    template<typename Selector, typename R = std::decay_t<std::invoke_result_t<Selector &> > >
    R pick(Selector selector, std::type_identity_t<PickEquality<R> > equality = {}) {
        auto &parent = current_hooks();
        if (!parent.tracks_reads()) { throw HooksContextError("pick", "an effect or a tracking scope"); }

        using state_t = detail::PickState<Selector, R>;
        auto state = std::make_shared<state_t>(std::move(selector),
                                               equality ? std::move(equality) : detail::default_pick_equality<R>());
        state->current = state->evaluate();
        if (state->reads.empty()) { return *state->current; }

        Value value;
        if constexpr (std::is_constructible_v<Value, const R &>) { value = Value(*state->current); }

        parent.on_read(ReadEvent{
            .key = detail::next_pick_key(),
            .store_id = {},
            .prop = {},
            .value = std::move(value),
            .subscribe = [state](Notification listener) -> Unsubscribe {
                auto subscription = std::make_shared<detail::PickSubscription<Selector, R> >(state, std::move(listener));
                subscription->subscribe_reads();
                return [subscription] { subscription->clear(); };
            },
        });
        return *state->current;
    }

    // pick() for Value results compared with a named equality.
    template<typename Selector>
        requires std::same_as<std::decay_t<std::invoke_result_t<Selector &> >, Value>
    Value pick(Selector selector, EqualityKind equality) {
        return pick(std::move(selector), PickEquality<Value>{resolve_equality(Equality{equality})});
    }

    /**
     * Turn fn into a function whose every call is a pick over fn's result.
     */
    template<typename Fn, typename Eq = std::nullptr_t>
    auto wrap_pick(Fn fn, Eq equality = nullptr) {
        return [fn = std::move(fn), equality](auto &&... args) {
            auto selector = [fn, ... captured = args] { return std::invoke(fn, captured...); };
            if constexpr (std::is_null_pointer_v<Eq>) {
                return pick(selector);
            } else {
                return pick(selector, equality);
            }
        };
    }

} // namespace rstore
