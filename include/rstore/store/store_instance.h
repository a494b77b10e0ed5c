#pragma once

/**
 * @file store_instance.h
 * @brief A live store: the current snapshot, its notification fan-out and the wrapped actions.
 *
 * Every read through a state view is reported to the current hooks and every accepted write replaces the snapshot,
 * fires the property listeners synchronously and schedules the store wide notification. Writes that the property's
 * equality judges equal change nothing and notify nobody.
 */

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/runtime/clock.h>
#include <rstore/store/store_spec.h>
#include <rstore/types/state.h>
#include <rstore/types/value.h>
#include <rstore/util/emitter.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rstore {

    struct PropertyChange {
        Value next;
        Value prev;
    };

    struct DispatchChange {
        dispatch_event_ptr next;
        dispatch_event_ptr prev;
    };

    using PropertyListener = std::function<void(const PropertyChange &)>;
    using DispatchListener = std::function<void(const DispatchChange &)>;

    /**
     * Tracked view over a store's state. Views refer to the instance weakly; using one after the instance is gone
     * throws DisposedInstanceError.
     */
    class RSTORE_EXPORT StateView {
    public:
        StateView() = default;

        // Tracked read of a property; throws UnknownPropertyError for keys outside the state template.
        [[nodiscard]] Value get(std::string_view key) const;

        [[nodiscard]] Value operator[](std::string_view key) const { return get(key); }

        [[nodiscard]] const std::vector<std::string> &keys() const;

        [[nodiscard]] std::string store_id() const;

    protected:
        explicit StateView(std::weak_ptr<StoreInstance> instance) : _instance{std::move(instance)} {}

        [[nodiscard]] std::shared_ptr<StoreInstance> lock() const;

        std::weak_ptr<StoreInstance> _instance;
    };

    /**
     * The externally visible state. Writes are rejected with a warning.
     */
    class RSTORE_EXPORT ReadonlyState : public StateView {
    public:
        ReadonlyState() = default;

        void set(std::string_view key, const Value &value) const;

    private:
        friend class StoreInstance;
        using StateView::StateView;
    };

    /**
     * The state as seen by setup code and actions.
     */
    class RSTORE_EXPORT MutableState : public StateView {
    public:
        MutableState() = default;

        void set(std::string_view key, Value value) const;

        // Read (tracked), transform and write back.
        void update(std::string_view key, const std::function<Value(const Value &)> &fn) const;

    private:
        friend class StoreInstance;
        using StateView::StateView;
    };

    /**
     * Callable handle to a wrapped action.
     */
    class RSTORE_EXPORT Action {
    public:
        template<typename... Ts>
        Value operator()(Ts &&... args) const {
            return call(Args{Value(std::forward<Ts>(args))...});
        }

        Value call(const Args &args) const;

        [[nodiscard]] const std::string &name() const { return _name; }

        /**
         * The latest invocation, or nullptr if there was none. Tracked like a property read, so effects re-run on
         * each dispatch of this action.
         */
        [[nodiscard]] dispatch_event_ptr last() const;

    private:
        friend class StoreInstance;

        Action(std::weak_ptr<StoreInstance> instance, std::size_t index, std::string name)
            : _instance{std::move(instance)}, _index{index}, _name{std::move(name)} {}

        std::weak_ptr<StoreInstance> _instance;
        std::size_t _index;
        std::string _name;
    };

    class RSTORE_EXPORT ActionMap {
    public:
        using const_iterator = std::vector<Action>::const_iterator;

        // Throws UnknownActionError.
        [[nodiscard]] const Action &operator[](std::string_view name) const;

        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] std::size_t size() const { return _actions.size(); }

        [[nodiscard]] bool empty() const { return _actions.empty(); }

        [[nodiscard]] const_iterator begin() const { return _actions.begin(); }

        [[nodiscard]] const_iterator end() const { return _actions.end(); }

    private:
        friend class StoreInstance;

        std::string _store_id;
        std::vector<Action> _actions;
        string_map<std::size_t> _index;
    };

    struct InstanceOptions {
        clock_s_ptr clock;
        // Delay between the last external unsubscribe and disposal of an auto-dispose instance.
        engine_time_delta_t grace_period{milliseconds(100)};
    };

    class RSTORE_EXPORT StoreInstance : public std::enable_shared_from_this<StoreInstance> {
    public:
        /**
         * Build an instance and run the spec's setup. Effects registered during setup start once setup has
         * returned; if setup throws, the partially built instance is disposed and the error propagates.
         */
        static instance_ptr create(const spec_ptr &spec, Container &container, InstanceOptions options = {});

        StoreInstance(const StoreInstance &) = delete;
        StoreInstance &operator=(const StoreInstance &) = delete;

        ~StoreInstance();

        [[nodiscard]] const std::string &id() const { return _id; }

        [[nodiscard]] const spec_ptr &spec() const { return _spec; }

        [[nodiscard]] const ReadonlyState &state() const { return _readonly_state; }

        [[nodiscard]] const ActionMap &actions() const { return _actions; }

        /**
         * Listen for any state change. The notification is scheduled, so one batch() delivers it once.
         */
        Unsubscribe subscribe(Notification listener);

        // Listen for changes of one property, delivered synchronously with each accepted write.
        Unsubscribe subscribe(std::string_view prop, PropertyListener listener);

        // Listen for dispatches of "@<action>" or, with "@*", of every action.
        Unsubscribe subscribe(std::string_view action, DispatchListener listener);

        Unsubscribe on_dispose(Notification listener);

        void dispose();

        [[nodiscard]] bool disposed() const { return _disposed; }

        // Whether the state (or one property) differs by identity from the state captured after setup.
        [[nodiscard]] bool dirty(std::optional<std::string_view> prop = std::nullopt) const;

        // Restore the post-setup state, notifying only the properties that differ.
        void reset();

        [[nodiscard]] Value dehydrate() const;

        // Apply a map of property values, skipping dirty properties and equal values.
        void hydrate(const Value &data);

        [[nodiscard]] const Snapshot &snapshot() const { return _current; }

        [[nodiscard]] const Snapshot &initial_snapshot() const { return _initial; }

        [[nodiscard]] std::size_t ref_count() const { return _ref_count; }

    private:
        friend class StateView;
        friend class ReadonlyState;
        friend class MutableState;
        friend class Action;
        friend class StoreContext;
        friend class Focus;

        struct ActionEntry {
            std::string name;
            ActionFn fn;
            std::size_t count{0};
            dispatch_event_ptr last;
            Emitter<DispatchChange> emitter;
        };

        StoreInstance(spec_ptr spec, InstanceOptions options);

        void run_setup(Container &container);

        [[nodiscard]] std::size_t index_of(std::string_view prop) const;

        [[nodiscard]] Value read(std::size_t index) const;

        void write(std::size_t index, Value next);

        void update(const std::function<void(Draft &)> &updater);

        void handle_property_change(std::size_t index, const Value &prev, const Value &next);

        Emitter<PropertyChange> &property_emitter(std::size_t index);

        // Subscription used by trackers; does not count towards the auto-dispose reference count.
        Unsubscribe subscribe_internal(std::size_t index, Notification listener);

        Value dispatch(std::size_t index, const Args &args);

        void emit_dispatch(ActionEntry &entry, const dispatch_event_ptr &next, const dispatch_event_ptr &prev);

        [[nodiscard]] dispatch_event_ptr last_dispatch(std::size_t index) const;

        Unsubscribe counted(Unsubscribe unsubscribe);

        void increment_ref();

        void decrement_ref();

        [[nodiscard]] const clock_s_ptr &clock() const { return _options.clock; }

        spec_ptr _spec;
        InstanceOptions _options;
        std::string _id;

        Snapshot _current;
        Snapshot _initial;

        ReadonlyState _readonly_state;
        MutableState _mutable_state;
        std::unique_ptr<StoreContext> _context;

        ActionMap _actions;
        std::vector<ActionEntry> _action_entries;
        Emitter<DispatchChange> _any_dispatch;
        dispatch_event_ptr _last_any;

        Emitter<> _change_emitter;
        std::vector<std::unique_ptr<Emitter<PropertyChange> > > _property_emitters;
        Emitter<> _dispose_emitter;
        Emitter<> _effect_disposers;

        bool _setup_phase{true};
        bool _disposed{false};
        std::size_t _ref_count{0};
        std::optional<Clock::alarm_id> _dispose_alarm;
    };

} // namespace rstore
