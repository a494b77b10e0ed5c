#pragma once

/**
 * @file emitter.h
 * @brief Emitter - deduplicated listener set used for every notification path in the library.
 *
 * Property change notifications, dispatch notifications, lifecycle events and effect cleanup stacks are all built on
 * this primitive.
 *
 * Key characteristics:
 * - Listeners are held by shared pointer; registering the same pointer twice has no effect
 * - Emission iterates a snapshot, so listeners added or removed while emitting do not affect the current delivery
 * - Unsubscribe functions are idempotent and remain safe to call after the emitter is gone
 * - A settled emitter delivers its final payload to late subscribers immediately
 */

#include <rstore/rstore_forward_declarations.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace rstore {

    template<typename T>
    struct emitter_listener {
        using type = std::function<void(const T &)>;
    };

    template<>
    struct emitter_listener<void> {
        using type = std::function<void()>;
    };

    template<typename T = void>
    class Emitter {
    public:
        using payload_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;
        using listener_type = typename emitter_listener<T>::type;
        using listener_ptr = std::shared_ptr<const listener_type>;

        Emitter() : _state{std::make_shared<State>()} {}

        Emitter(const Emitter &) = delete;
        Emitter &operator=(const Emitter &) = delete;
        Emitter(Emitter &&) noexcept = default;
        Emitter &operator=(Emitter &&) noexcept = default;

        /**
         * @brief Add a listener; every call creates a distinct registration.
         */
        Unsubscribe on(listener_type listener) {
            return on(std::make_shared<const listener_type>(std::move(listener)));
        }

        /**
         * @brief Add a shared listener. The same pointer registered twice is only called once per emission.
         */
        Unsubscribe on(listener_ptr listener) {
            return add({std::move(listener)});
        }

        Unsubscribe on(std::vector<listener_type> listeners) {
            std::vector<listener_ptr> ptrs;
            ptrs.reserve(listeners.size());
            for (auto &l: listeners) { ptrs.push_back(std::make_shared<const listener_type>(std::move(l))); }
            return add(std::move(ptrs));
        }

        /**
         * @brief Subscribe through a mapping function.
         *
         * The map receives the emitted payload and returns std::optional<U>; an empty optional suppresses delivery,
         * otherwise the listener receives the mapped value.
         */
        template<typename Map, typename Listener>
            requires (!std::is_void_v<T>)
        Unsubscribe on(Map map, Listener listener) {
            return on(listener_type{
                [map = std::move(map), listener = std::move(listener)](const payload_type &payload) {
                    auto mapped = map(payload);
                    if (mapped) { listener(*mapped); }
                }
            });
        }

        void emit() requires std::is_void_v<T> { emit_payload(payload_type{}); }

        void emit(const payload_type &payload) requires (!std::is_void_v<T>) { emit_payload(payload); }

        void emit_and_clear() requires std::is_void_v<T> { emit_and_clear_payload(payload_type{}); }

        void emit_and_clear(const payload_type &payload) requires (!std::is_void_v<T>) {
            emit_and_clear_payload(payload);
        }

        void emit_lifo() requires std::is_void_v<T> {
            if (_state->settled) { return; }
            do_emit(payload_type{}, false, true);
        }

        /**
         * @brief Emit in reverse registration order, then clear. Used for cleanup stacks.
         */
        void emit_and_clear_lifo() requires std::is_void_v<T> {
            if (_state->settled) { return; }
            do_emit(payload_type{}, true, true);
        }

        void settle() requires std::is_void_v<T> { settle_payload(payload_type{}); }

        void settle(const payload_type &payload) requires (!std::is_void_v<T>) { settle_payload(payload); }

        void clear() { _state->listeners.clear(); }

        [[nodiscard]] std::size_t size() const { return _state->listeners.size(); }

        [[nodiscard]] bool empty() const { return _state->listeners.empty(); }

        [[nodiscard]] bool settled() const { return _state->settled; }

    private:
        struct State {
            std::vector<listener_ptr> listeners;
            std::optional<payload_type> settled_payload;
            bool settled{false};
        };

        static void invoke(const listener_type &listener, const payload_type &payload) {
            if constexpr (std::is_void_v<T>) {
                listener();
            } else {
                listener(payload);
            }
        }

        Unsubscribe add(std::vector<listener_ptr> new_listeners) {
            if (_state->settled) {
                for (const auto &l: new_listeners) { invoke(*l, *_state->settled_payload); }
                return [] {};
            }
            auto &listeners = _state->listeners;
            for (const auto &l: new_listeners) {
                if (std::find(listeners.begin(), listeners.end(), l) == listeners.end()) { listeners.push_back(l); }
            }
            return [weak = std::weak_ptr<State>(_state), new_listeners = std::move(new_listeners)] {
                auto state = weak.lock();
                if (!state) { return; }
                auto &ls = state->listeners;
                for (const auto &l: new_listeners) {
                    auto it = std::find(ls.begin(), ls.end(), l);
                    if (it != ls.end()) { ls.erase(it); }
                }
            };
        }

        void emit_payload(const payload_type &payload) {
            if (_state->settled) { return; }
            do_emit(payload, false, false);
        }

        void emit_and_clear_payload(const payload_type &payload) {
            if (_state->settled) { return; }
            do_emit(payload, true, false);
        }

        void settle_payload(const payload_type &payload) {
            if (_state->settled) { return; }
            // Flag first so listeners added during this emission are invoked immediately.
            _state->settled_payload = payload;
            _state->settled = true;
            do_emit(payload, true, false);
        }

        void do_emit(const payload_type &payload, bool clear, bool lifo) {
            // Keep the state alive: a listener may destroy the owner of this emitter.
            auto state = _state;
            auto snapshot = state->listeners;
            if (clear) { state->listeners.clear(); }
            if (lifo) {
                for (auto it = snapshot.rbegin(); it != snapshot.rend(); ++it) { invoke(**it, payload); }
            } else {
                for (const auto &l: snapshot) { invoke(*l, payload); }
            }
        }

        std::shared_ptr<State> _state;
    };

} // namespace rstore
