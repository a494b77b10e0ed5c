#include <rstore/runtime/hooks.h>
#include <rstore/store/store_context.h>
#include <rstore/store/store_instance.h>
#include <rstore/util/errors.h>
#include <rstore/util/logging.h>

#include <fmt/format.h>

namespace rstore {

    std::shared_ptr<StoreInstance> StateView::lock() const {
        auto instance = _instance.lock();
        if (!instance) { throw DisposedInstanceError("<released>"); }
        return instance;
    }

    Value StateView::get(std::string_view key) const {
        auto instance = lock();
        return instance->read(instance->index_of(key));
    }

    const std::vector<std::string> &StateView::keys() const { return lock()->_spec->fields(); }

    std::string StateView::store_id() const { return lock()->id(); }

    void ReadonlyState::set(std::string_view key, const Value &value) const {
        auto instance = lock();
        log_warning("Ignored write of {} to '{}' on the read-only state of store '{}'; use an action", value, key,
                    instance->id());
    }

    void MutableState::set(std::string_view key, Value value) const {
        auto instance = lock();
        instance->write(instance->index_of(key), std::move(value));
    }

    void MutableState::update(std::string_view key, const std::function<Value(const Value &)> &fn) const {
        auto instance = lock();
        auto index = instance->index_of(key);
        instance->write(index, fn(instance->read(index)));
    }

    Value Action::call(const Args &args) const {
        auto instance = _instance.lock();
        if (!instance) { throw DisposedInstanceError(fmt::format("<released>@{}", _name)); }
        return instance->dispatch(_index, args);
    }

    dispatch_event_ptr Action::last() const {
        auto instance = _instance.lock();
        if (!instance) { return nullptr; }
        return instance->last_dispatch(_index);
    }

    const Action &ActionMap::operator[](std::string_view name) const {
        auto it = _index.find(name);
        if (it == _index.end()) { throw UnknownActionError(_store_id, name); }
        return _actions[it->second];
    }

    bool ActionMap::contains(std::string_view name) const { return _index.contains(name); }

    StoreInstance::StoreInstance(spec_ptr spec, InstanceOptions options)
        : _spec{std::move(spec)}, _options{std::move(options)}, _id{generate_store_id(_spec->name())},
          _current{_spec->initial_state()}, _initial{_current} {
        if (!_options.clock) { _options.clock = default_clock(); }
        _property_emitters.resize(_spec->fields().size());
        _actions._store_id = _id;
    }

    StoreInstance::~StoreInstance() {
        if (_dispose_alarm) { _options.clock->cancel_alarm(*_dispose_alarm); }
    }

    instance_ptr StoreInstance::create(const spec_ptr &spec, Container &container, InstanceOptions options) {
        auto instance = instance_ptr(new StoreInstance(spec, std::move(options)));
        instance->_readonly_state = ReadonlyState{instance};
        instance->_mutable_state = MutableState{instance};
        instance->run_setup(container);
        return instance;
    }

    void StoreInstance::run_setup(Container &container) {
        _context.reset(new StoreContext(*this, &container));
        std::vector<EffectRunner> scheduled;

        Actions definitions;
        try {
            definitions = with_hooks(
                HookPatch{.schedule_effect = [&scheduled](EffectRunner runner) {
                    scheduled.push_back(std::move(runner));
                }},
                [&] { return _spec->options().setup ? _spec->options().setup(*_context) : Actions{}; });
        } catch (...) {
            _setup_phase = false;
            _context->_container = nullptr;
            dispose();
            throw;
        }
        _setup_phase = false;
        _context->_container = nullptr;

        RunEffectOptions run_options{
            .on_error = _spec->options().on_error,
            .default_strategy = _spec->options().effect_error_strategy,
            .clock = _options.clock,
        };
        try {
            for (auto &runner: scheduled) { _effect_disposers.on(runner(run_options)); }
        } catch (...) {
            dispose();
            throw;
        }

        // Dirty tracking starts here.
        _initial = _current;

        auto self = weak_from_this();
        _action_entries.reserve(definitions.size());
        for (auto &[name, definition]: definitions) {
            if (_actions._index.contains(name)) {
                throw_error<std::invalid_argument>("Store '{}' defines action '{}' twice", _id, name);
            }
            auto index = _action_entries.size();
            _action_entries.push_back(ActionEntry{.name = name, .fn = std::move(definition.fn)});
            _actions._index.emplace(name, index);
            _actions._actions.push_back(Action{self, index, name});
        }
    }

    std::size_t StoreInstance::index_of(std::string_view prop) const {
        auto index = _spec->schema()->index_of(prop);
        if (!index) { throw UnknownPropertyError(_id, prop); }
        return *index;
    }

    Value StoreInstance::read(std::size_t index) const {
        auto value = _current->at(index);
        if (is_tracking_reads()) {
            const auto &prop = _spec->schema()->key(index);
            track_read(ReadEvent{
                .key = fmt::format("{}.{}", _id, prop),
                .store_id = _id,
                .prop = prop,
                .value = value,
                .subscribe = [weak = std::weak_ptr<StoreInstance>(
                                  std::const_pointer_cast<StoreInstance>(shared_from_this())),
                              index](Notification listener) -> Unsubscribe {
                    auto instance = weak.lock();
                    if (!instance) { return [] {}; }
                    return instance->subscribe_internal(index, std::move(listener));
                },
            });
        }
        return value;
    }

    void StoreInstance::write(std::size_t index, Value next) {
        auto prev = _current->at(index);
        if (is_tracking_writes()) {
            const auto &prop = _spec->schema()->key(index);
            track_write(WriteEvent{
                .key = fmt::format("{}.{}", _id, prop),
                .store_id = _id,
                .prop = prop,
                .next = next,
                .prev = prev,
            });
        }
        if (_spec->equality().equal(index, prev, next)) { return; }
        _current = _current->with(index, next);
        handle_property_change(index, prev, next);
    }

    void StoreInstance::update(const std::function<void(Draft &)> &updater) {
        Draft draft{_current, _id};
        updater(draft);

        auto changed = draft.changed();
        if (changed.empty()) { return; }

        const auto &prev_values = _current->values();
        auto values = draft.values();
        const bool tracking_writes = is_tracking_writes();
        std::vector<std::size_t> notify;
        notify.reserve(changed.size());
        for (auto index: changed) {
            if (tracking_writes) {
                const auto &prop = _spec->schema()->key(index);
                track_write(WriteEvent{
                    .key = fmt::format("{}.{}", _id, prop),
                    .store_id = _id,
                    .prop = prop,
                    .next = values[index],
                    .prev = prev_values[index],
                });
            }
            if (_spec->equality().has_custom() && _spec->equality().equal(index, prev_values[index], values[index])) {
                // Keep the old reference for values judged equal.
                values[index] = prev_values[index];
            } else {
                notify.push_back(index);
            }
        }
        if (notify.empty()) { return; }

        auto prev = _current;
        _current = std::make_shared<const StateRecord>(prev->schema(), std::move(values));
        for (auto index: notify) { handle_property_change(index, prev->at(index), _current->at(index)); }
    }

    void StoreInstance::handle_property_change(std::size_t index, const Value &prev, const Value &next) {
        if (auto &emitter = _property_emitters[index]) { emitter->emit(PropertyChange{next, prev}); }
        schedule_notification(
            [weak = weak_from_this()] {
                if (auto instance = weak.lock()) { instance->_change_emitter.emit(); }
            },
            &_change_emitter);
    }

    Emitter<PropertyChange> &StoreInstance::property_emitter(std::size_t index) {
        auto &emitter = _property_emitters[index];
        if (!emitter) { emitter = std::make_unique<Emitter<PropertyChange> >(); }
        return *emitter;
    }

    Unsubscribe StoreInstance::subscribe_internal(std::size_t index, Notification listener) {
        if (_disposed) { return [] {}; }
        return property_emitter(index).on([listener = std::move(listener)](const PropertyChange &) { listener(); });
    }

    Unsubscribe StoreInstance::subscribe(Notification listener) {
        increment_ref();
        return counted(_change_emitter.on(std::move(listener)));
    }

    Unsubscribe StoreInstance::subscribe(std::string_view prop, PropertyListener listener) {
        auto index = index_of(prop);
        increment_ref();
        return counted(property_emitter(index).on(std::move(listener)));
    }

    Unsubscribe StoreInstance::subscribe(std::string_view action, DispatchListener listener) {
        if (!action.starts_with('@')) {
            throw_error<std::invalid_argument>("Dispatch subscriptions take '@<action>' or '@*', got '{}'", action);
        }
        auto name = action.substr(1);
        Emitter<DispatchChange> *emitter{&_any_dispatch};
        if (name != "*") {
            auto it = _actions._index.find(name);
            if (it == _actions._index.end()) { throw UnknownActionError(_id, name); }
            emitter = &_action_entries[it->second].emitter;
        }
        increment_ref();
        return counted(emitter->on(std::move(listener)));
    }

    Unsubscribe StoreInstance::counted(Unsubscribe unsubscribe) {
        return [weak = weak_from_this(), unsubscribe = std::move(unsubscribe), done = false]() mutable {
            if (done) { return; }
            done = true;
            unsubscribe();
            if (auto instance = weak.lock()) { instance->decrement_ref(); }
        };
    }

    void StoreInstance::increment_ref() {
        if (!_spec->is_auto_dispose() || _setup_phase) { return; }
        ++_ref_count;
        if (_dispose_alarm) {
            clock()->cancel_alarm(*_dispose_alarm);
            _dispose_alarm.reset();
        }
    }

    void StoreInstance::decrement_ref() {
        if (!_spec->is_auto_dispose() || _setup_phase) { return; }
        if (_ref_count > 0) { --_ref_count; }
        if (_ref_count > 0 || _disposed) { return; }
        if (_dispose_alarm) { clock()->cancel_alarm(*_dispose_alarm); }
        _dispose_alarm = clock()->set_alarm(_options.grace_period, [weak = weak_from_this()] {
            auto instance = weak.lock();
            if (!instance) { return; }
            instance->_dispose_alarm.reset();
            // A subscriber may have come and gone while the alarm was pending.
            if (instance->_ref_count == 0 && !instance->_disposed) { instance->dispose(); }
        });
    }

    Unsubscribe StoreInstance::on_dispose(Notification listener) { return _dispose_emitter.on(std::move(listener)); }

    void StoreInstance::dispose() {
        if (_disposed) { return; }
        _disposed = true;

        if (_dispose_alarm) {
            clock()->cancel_alarm(*_dispose_alarm);
            _dispose_alarm.reset();
        }

        auto self = shared_from_this();
        _effect_disposers.emit_and_clear();
        _change_emitter.clear();
        for (auto &emitter: _property_emitters) {
            if (emitter) { emitter->clear(); }
        }
        for (auto &entry: _action_entries) { entry.emitter.clear(); }
        _any_dispatch.clear();

        _dispose_emitter.emit_and_clear();
    }

    bool StoreInstance::dirty(std::optional<std::string_view> prop) const {
        if (prop) {
            auto index = index_of(*prop);
            return !identical(_current->at(index), _initial->at(index));
        }
        return _current != _initial;
    }

    void StoreInstance::reset() {
        if (_current == _initial) { return; }
        auto prev = std::exchange(_current, _initial);
        for (std::size_t index = 0; index < prev->size(); ++index) {
            if (!identical(prev->at(index), _initial->at(index))) {
                handle_property_change(index, prev->at(index), _initial->at(index));
            }
        }
    }

    Value StoreInstance::dehydrate() const {
        auto state = _current->to_map();
        if (const auto &normalize = _spec->options().normalize) { return normalize(state); }
        return state;
    }

    void StoreInstance::hydrate(const Value &data) {
        const auto &denormalize = _spec->options().denormalize;
        auto incoming = denormalize ? denormalize(data) : data;
        if (!incoming.is_map()) {
            throw_error<std::invalid_argument>("Store '{}' can only hydrate from a map, got {}", _id,
                                               to_string(incoming.kind()));
        }
        for (const auto &[key, next]: incoming.as_map()) {
            auto index = _spec->schema()->index_of(key);
            if (!index) {
                log_debug("Store '{}' ignored unknown property '{}' while hydrating", _id, key);
                continue;
            }
            // Properties changed since setup hold fresher data than the snapshot being applied.
            if (!identical(_current->at(*index), _initial->at(*index))) { continue; }
            auto prev = _current->at(*index);
            if (_spec->equality().equal(*index, prev, next)) { continue; }
            _current = _current->with(*index, next);
            handle_property_change(*index, prev, next);
        }
    }

    Value StoreInstance::dispatch(std::size_t index, const Args &args) {
        if (_disposed) { throw DisposedInstanceError(_id); }

        auto &entry = _action_entries[index];
        auto next = std::make_shared<const DispatchEvent>(DispatchEvent{
            .name = entry.name,
            .args = args,
            .nth = ++entry.count,
            .timestamp = clock()->now(),
        });

        // Recorded before the call so last() also reports invocations that throw.
        auto prev = std::exchange(entry.last, next);

        Value result;
        try {
            result = entry.fn(args);
        } catch (...) {
            if (const auto &on_error = _spec->options().on_error) { on_error(std::current_exception()); }
            emit_dispatch(entry, next, prev);
            throw;
        }
        if (const auto &on_dispatch = _spec->options().on_dispatch) { on_dispatch(*next); }
        emit_dispatch(entry, next, prev);
        return result;
    }

    void StoreInstance::emit_dispatch(ActionEntry &entry, const dispatch_event_ptr &next,
                                      const dispatch_event_ptr &prev) {
        entry.emitter.emit(DispatchChange{next, prev});
        auto prev_any = std::exchange(_last_any, next);
        _any_dispatch.emit(DispatchChange{next, prev_any});
    }

    dispatch_event_ptr StoreInstance::last_dispatch(std::size_t index) const {
        const auto &entry = _action_entries[index];
        if (is_tracking_reads()) {
            auto name = fmt::format("@{}", entry.name);
            Value value;
            if (entry.last) { value = Value::object<DispatchEvent>(entry.last); }
            track_read(ReadEvent{
                .key = fmt::format("{}.{}", _id, name),
                .store_id = _id,
                .prop = name,
                .value = std::move(value),
                .subscribe = [weak = std::weak_ptr<StoreInstance>(
                                  std::const_pointer_cast<StoreInstance>(shared_from_this())),
                              index](Notification listener) -> Unsubscribe {
                    auto instance = weak.lock();
                    if (!instance || instance->_disposed) { return [] {}; }
                    return instance->_action_entries[index].emitter.on(
                        [listener = std::move(listener)](const DispatchChange &) { listener(); });
                },
            });
        }
        return entry.last;
    }

} // namespace rstore
