#include <rstore/runtime/hooks.h>
#include <rstore/store/container.h>
#include <rstore/store/store_context.h>
#include <rstore/util/errors.h>

namespace rstore {

    namespace {
        Value::Path tail(const Value::Path &path) { return Value::Path(path.begin() + 1, path.end()); }
    } // namespace

    Focus::Focus(std::weak_ptr<StoreInstance> instance, StoreContext *context, Value::Path path, FocusOptions options)
        : _instance{std::move(instance)}, _context{context}, _path{std::move(path)},
          _fallback{std::move(options.fallback)}, _equality{resolve_equality(options.equality)} {}

    std::shared_ptr<StoreInstance> Focus::lock() const {
        auto instance = _instance.lock();
        if (!instance || instance->disposed()) {
            throw DisposedInstanceError(instance ? instance->id() : std::string{"<released>"});
        }
        return instance;
    }

    Value Focus::apply_fallback(Value value) const {
        if (value.is_null() && _fallback) { return _fallback(); }
        return value;
    }

    Value Focus::get() const {
        auto instance = lock();
        auto root = instance->read(instance->index_of(_path.front()));
        return apply_fallback(root.get_in(tail(_path)));
    }

    void Focus::set(Value value) const {
        auto instance = lock();
        instance->update([&](Draft &draft) { draft.set_in(_path, std::move(value)); });
    }

    void Focus::set(const std::function<Value(const Value &)> &reducer) const {
        auto current = untrack([this] { return get(); });
        set(reducer(current));
    }

    Unsubscribe Focus::on(PropertyListener listener) const {
        auto instance = lock();
        auto index = instance->index_of(_path.front());
        auto sub_path = tail(_path);
        return instance->property_emitter(index).on(
            [this_focus = *this, sub_path = std::move(sub_path), listener = std::move(listener)](
            const PropertyChange &change) {
                auto next = this_focus.apply_fallback(change.next.get_in(sub_path));
                auto prev = this_focus.apply_fallback(change.prev.get_in(sub_path));
                if (this_focus._equality(prev, next)) { return; }
                listener(PropertyChange{std::move(next), std::move(prev)});
            });
    }

    Focus Focus::to(std::string_view relative_path, FocusOptions options) const {
        lock();
        _context->require_setup("focus");
        auto path = _path;
        for (auto &segment: parse_path(relative_path)) { path.push_back(std::move(segment)); }
        return Focus{_instance, _context, std::move(path), std::move(options)};
    }

    const MutableState &StoreContext::state() const { return _instance._mutable_state; }

    const std::string &StoreContext::id() const { return _instance.id(); }

    bool StoreContext::is_setup_phase() const { return _instance._setup_phase; }

    void StoreContext::require_setup(std::string_view method, std::string_view hint) const {
        if (!_instance._setup_phase || _container == nullptr) { throw SetupPhaseError(method, hint); }
    }

    void StoreContext::check_lifetime(const StoreSpec &other, std::string_view operation) const {
        if (!_instance.spec()->is_auto_dispose() && other.is_auto_dispose()) {
            throw LifetimeMismatchError(_instance.spec()->name(), other.name(), operation);
        }
    }

    StoreRef StoreContext::get(const spec_ptr &spec) {
        require_setup("get", "Declare all dependencies at the top of your setup function.");
        check_lifetime(*spec, "depend on");
        auto dependency = _container->get(spec);
        return StoreRef{dependency->state(), dependency->actions()};
    }

    instance_ptr StoreContext::create(const spec_ptr &spec) {
        require_setup("create", "Create child stores while the parent's setup function runs.");
        check_lifetime(*spec, "create");
        auto child = _container->create(spec);
        _instance._dispose_emitter.on([child] { child->dispose(); });
        return child;
    }

    void StoreContext::update(const std::function<void(Draft &)> &updater) { _instance.update(updater); }

    void StoreContext::update(const StateTemplate &partial) {
        _instance.update([&partial](Draft &draft) { draft.assign(partial); });
    }

    ActionDefinition StoreContext::make_action(std::function<void(Draft &, const Args &)> updater) {
        return ActionDefinition{[this, updater = std::move(updater)](const Args &args) {
            update([&](Draft &draft) { updater(draft, args); });
        }};
    }

    bool StoreContext::dirty(std::optional<std::string_view> prop) const { return _instance.dirty(prop); }

    void StoreContext::reset() { _instance.reset(); }

    void StoreContext::on_dispose(Notification callback) {
        static_cast<void>(_instance.on_dispose(std::move(callback)));
    }

    Focus StoreContext::focus(std::string_view path, FocusOptions options) {
        require_setup("focus");
        auto parsed = parse_path(path);
        if (parsed.empty()) { throw_error<std::invalid_argument>("focus() needs a non-empty path"); }
        static_cast<void>(_instance.index_of(parsed.front()));
        return Focus{_instance.weak_from_this(), this, std::move(parsed), std::move(options)};
    }

} // namespace rstore
