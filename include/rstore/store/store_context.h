#pragma once

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/runtime/effect.h>
#include <rstore/store/container.h>
#include <rstore/store/factory.h>
#include <rstore/store/store_instance.h>
#include <rstore/store/store_spec.h>
#include <rstore/types/equality.h>
#include <rstore/types/state.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rstore {

    // State and actions of a dependency resolved during setup.
    struct StoreRef {
        ReadonlyState state;
        ActionMap actions;
    };

    struct FocusOptions {
        // Substituted when the focused value is null.
        std::function<Value()> fallback;
        std::optional<Equality> equality;
    };

    /**
     * Getter/setter pair over a dotted path inside a store's state. The first segment names the property.
     */
    class RSTORE_EXPORT Focus {
    public:
        // Tracked read of the focused value, with the fallback applied.
        [[nodiscard]] Value get() const;

        [[nodiscard]] Value operator()() const { return get(); }

        // Replace the focused value, creating intermediate maps as needed.
        void set(Value value) const;

        // Replace the focused value with reducer(current); current has the fallback applied.
        void set(const std::function<Value(const Value &)> &reducer) const;

        /**
         * Listen for changes of the focused value as judged by the focus equality.
         */
        Unsubscribe on(PropertyListener listener) const;

        // A focus on a path relative to this one; setup phase only.
        [[nodiscard]] Focus to(std::string_view relative_path, FocusOptions options = {}) const;

        [[nodiscard]] const Value::Path &path() const { return _path; }

    private:
        friend class StoreContext;

        Focus(std::weak_ptr<StoreInstance> instance, StoreContext *context, Value::Path path, FocusOptions options);

        [[nodiscard]] std::shared_ptr<StoreInstance> lock() const;

        [[nodiscard]] Value apply_fallback(Value value) const;

        std::weak_ptr<StoreInstance> _instance;
        StoreContext *_context;
        Value::Path _path;
        std::function<Value()> _fallback;
        EqualityFn _equality;
    };

    /**
     * The context handed to a spec's setup function. It lives as long as the instance, so actions and effects may
     * capture it by reference. Dependency resolution, child creation, effects, mixins and focus are only available
     * while setup runs.
     */
    class RSTORE_EXPORT StoreContext {
    public:
        StoreContext(const StoreContext &) = delete;
        StoreContext &operator=(const StoreContext &) = delete;

        [[nodiscard]] const MutableState &state() const;

        [[nodiscard]] const std::string &id() const;

        [[nodiscard]] bool is_setup_phase() const;

        /**
         * Resolve a dependency through the container (cached). A keep-alive store may not depend on an
         * auto-dispose one.
         */
        StoreRef get(const spec_ptr &spec);

        /**
         * Create an uncached child instance that is disposed together with this store. Same lifetime rule as get().
         */
        instance_ptr create(const spec_ptr &spec);

        // The container's cached service for factory.
        template<typename T>
        std::shared_ptr<T> get(const Factory<T> &factory) {
            require_setup("get", "Declare all dependencies at the top of your setup function.");
            return _container->get(factory);
        }

        /**
         * A fresh service owned by this store: released, and disposed when it has a dispose() member, together with
         * the store.
         */
        template<typename T>
        std::shared_ptr<T> create(const Factory<T> &factory) {
            require_setup("create", "Create child stores while the parent's setup function runs.");
            auto service = _container->create(factory);
            if constexpr (Disposable<T>) {
                on_dispose([service] { service->dispose(); });
            } else {
                on_dispose([held = std::shared_ptr<void>(service)]() mutable { held.reset(); });
            }
            return service;
        }

        // Apply a batch of changes through a copy-on-write draft.
        void update(const std::function<void(Draft &)> &updater);

        void update(const StateTemplate &partial);

        // An action that applies updater(draft, args) as one update().
        [[nodiscard]] ActionDefinition make_action(std::function<void(Draft &, const Args &)> updater);

        [[nodiscard]] bool dirty(std::optional<std::string_view> prop = std::nullopt) const;

        void reset();

        void on_dispose(Notification callback);

        template<typename Mixin, typename... Ts>
        decltype(auto) mixin(Mixin &&fn, Ts &&... args) {
            require_setup("mixin");
            return std::invoke(std::forward<Mixin>(fn), *this, std::forward<Ts>(args)...);
        }

        /**
         * Register an effect owned by this store. It starts when setup returns, uses the store's error callback
         * and default strategy, and is disposed with the store.
         */
        template<typename Fn>
        Unsubscribe effect(Fn fn, EffectOptions options = {}) {
            require_setup("effect");
            return rstore::effect(std::move(fn), std::move(options));
        }

        [[nodiscard]] Focus focus(std::string_view path, FocusOptions options = {});

    private:
        friend class StoreInstance;
        friend class Focus;

        StoreContext(StoreInstance &instance, Container *container) : _instance{instance}, _container{container} {}

        void require_setup(std::string_view method, std::string_view hint = {}) const;

        void check_lifetime(const StoreSpec &other, std::string_view operation) const;

        StoreInstance &_instance;
        Container *_container;
    };

} // namespace rstore
