#pragma once

/**
 * @file container.h
 * @brief Instance lifecycle container: caches one instance per spec, builds instances through the middleware
 * chain, detects circular construction and disposes in reverse creation order.
 */

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/runtime/clock.h>
#include <rstore/store/factory.h>
#include <rstore/store/store_instance.h>
#include <rstore/util/emitter.h>
#include <rstore/util/hash.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rstore {

    using Next = std::function<instance_ptr(const spec_ptr &)>;

    // Wraps instance construction; call next(spec) to continue down the chain.
    using Middleware = std::function<instance_ptr(const spec_ptr &, const Next &)>;

    struct ContainerOptions {
        std::vector<Middleware> middleware;
        clock_s_ptr clock;
        engine_time_delta_t grace_period{milliseconds(100)};
    };

    // Process-wide middleware wrapped around the middleware of every container created afterwards.
    struct DefaultMiddleware {
        // Outermost, before the container's own middleware.
        std::vector<Middleware> pre;
        // Innermost, after the container's own middleware.
        std::vector<Middleware> post;
    };

    struct ScopeOptions {
        // Replaces the inherited middleware when set.
        std::optional<std::vector<Middleware> > middleware;
    };

    class RSTORE_EXPORT Container : public std::enable_shared_from_this<Container> {
    public:
        using instance_listener = std::function<void(const instance_ptr &)>;

        static container_ptr create(ContainerOptions options = {});

        // Append to the process-wide defaults. Containers that already exist are not affected.
        static void defaults(DefaultMiddleware config);

        static void clear_defaults();

        Container(const Container &) = delete;
        Container &operator=(const Container &) = delete;

        // Disposes every instance created here, see clear().
        ~Container();

        /**
         * The cached instance for spec, building it on first use. A scoped container without overrides answers from
         * its parent's cache when the parent already holds the spec.
         */
        instance_ptr get(const spec_ptr &spec);

        // Lookup by instance id; nullptr when unknown.
        [[nodiscard]] instance_ptr get(std::string_view id) const;

        // The cached instance, without building one.
        [[nodiscard]] instance_ptr try_get(const spec_ptr &spec) const;

        // A fresh, uncached instance.
        instance_ptr create(const spec_ptr &spec);

        // Build override whenever spec is requested; any cached instance of spec is disposed.
        void set(const spec_ptr &spec, spec_ptr override_spec);

        [[nodiscard]] bool has(const spec_ptr &spec) const;

        bool dispose(const spec_ptr &spec);

        // Dispose all cached instances, most recently created first.
        void clear();

        /**
         * The cached service built by factory, building it on first use. Same parent fallback and circular
         * construction check as stores; factories do not run through the middleware chain.
         */
        template<typename T>
        std::shared_ptr<T> get(const Factory<T> &factory) {
            return std::static_pointer_cast<T>(get_service(factory.definition()));
        }

        template<typename T>
        [[nodiscard]] std::shared_ptr<T> try_get(const Factory<T> &factory) const {
            return std::static_pointer_cast<T>(try_get_service(factory.definition()));
        }

        // A fresh, uncached service.
        template<typename T>
        std::shared_ptr<T> create(const Factory<T> &factory) {
            return std::static_pointer_cast<T>(create_service(factory.definition()));
        }

        // Build override whenever factory is requested; a cached service is released.
        template<typename T>
        void set(const Factory<T> &factory, const Factory<T> &override_factory) {
            set_service(factory.definition(), override_factory.definition());
        }

        template<typename T>
        [[nodiscard]] bool has(const Factory<T> &factory) const {
            return try_get_service(factory.definition()) != nullptr;
        }

        [[nodiscard]] container_ptr scope(ScopeOptions options = {});

        Unsubscribe on_create(instance_listener listener);

        Unsubscribe on_dispose(instance_listener listener);

        [[nodiscard]] const clock_s_ptr &clock() const { return _options.clock; }

        // Cached instances in creation order.
        [[nodiscard]] std::vector<instance_ptr> instances() const;

    private:
        Container(ContainerOptions options, container_ptr parent);

        [[nodiscard]] const spec_ptr &resolve(const spec_ptr &spec) const;

        instance_ptr create_instance(const spec_ptr &key, const spec_ptr &mapped);

        instance_ptr run_chain(const spec_ptr &spec);

        void forget(const spec_ptr &key, const instance_ptr &instance);

        std::shared_ptr<void> get_service(const factory_definition_ptr &factory);

        [[nodiscard]] std::shared_ptr<void> try_get_service(const factory_definition_ptr &factory) const;

        std::shared_ptr<void> create_service(const factory_definition_ptr &factory);

        void set_service(const factory_definition_ptr &factory, factory_definition_ptr override_factory);

        ContainerOptions _options;
        container_ptr _parent;

        // Keyed by the requested spec, which is not the built one when an override is set.
        ankerl::unordered_dense::map<spec_ptr, instance_ptr> _cache;
        string_map<instance_ptr> _by_id;
        ankerl::unordered_dense::map<spec_ptr, spec_ptr> _overrides;
        std::vector<spec_ptr> _creation_order;
        ankerl::unordered_dense::set<spec_ptr> _creating;

        ankerl::unordered_dense::map<factory_definition_ptr, std::shared_ptr<void> > _services;
        ankerl::unordered_dense::map<factory_definition_ptr, factory_definition_ptr> _service_overrides;
        ankerl::unordered_dense::set<factory_definition_ptr> _creating_services;

        Emitter<instance_ptr> _create_emitter;
        Emitter<instance_ptr> _dispose_emitter;
    };

} // namespace rstore
