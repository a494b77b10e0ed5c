#include <rstore/runtime/hooks.h>
#include <rstore/store/container.h>
#include <rstore/util/errors.h>
#include <rstore/util/logging.h>
#include <rstore/util/scope.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <ranges>

namespace rstore {

    namespace {
        struct DefaultsState {
            std::mutex mutex;
            DefaultMiddleware config;
        };

        DefaultsState &defaults_state() {
            static DefaultsState state;
            return state;
        }

        std::vector<Middleware> with_defaults(std::vector<Middleware> middleware) {
            auto &state = defaults_state();
            std::lock_guard lock{state.mutex};
            std::vector<Middleware> result;
            result.reserve(state.config.pre.size() + middleware.size() + state.config.post.size());
            result.insert(result.end(), state.config.pre.begin(), state.config.pre.end());
            std::ranges::move(middleware, std::back_inserter(result));
            result.insert(result.end(), state.config.post.begin(), state.config.post.end());
            return result;
        }
    } // namespace

    container_ptr Container::create(ContainerOptions options) {
        options.middleware = with_defaults(std::move(options.middleware));
        return container_ptr(new Container(std::move(options), nullptr));
    }

    void Container::defaults(DefaultMiddleware config) {
        auto &state = defaults_state();
        std::lock_guard lock{state.mutex};
        std::ranges::move(config.pre, std::back_inserter(state.config.pre));
        std::ranges::move(config.post, std::back_inserter(state.config.post));
    }

    void Container::clear_defaults() {
        auto &state = defaults_state();
        std::lock_guard lock{state.mutex};
        state.config = DefaultMiddleware{};
    }

    Container::Container(ContainerOptions options, container_ptr parent)
        : _options{std::move(options)}, _parent{std::move(parent)} {
        if (!_options.clock) { _options.clock = default_clock(); }
    }

    Container::~Container() {
        try {
            clear();
        } catch (const std::exception &e) {
            log_warning("Error while disposing container instances: {}", e.what());
        }
    }

    const spec_ptr &Container::resolve(const spec_ptr &spec) const {
        auto it = _overrides.find(spec);
        return it == _overrides.end() ? spec : it->second;
    }

    instance_ptr Container::get(const spec_ptr &spec) {
        if (auto it = _cache.find(spec); it != _cache.end()) { return it->second; }
        if (_parent && _overrides.empty() && _parent->has(spec)) { return _parent->get(spec); }

        if (_creating.contains(spec)) { throw CircularDependencyError(spec->name()); }
        _creating.insert(spec);
        auto done = make_scope_exit([this, &spec] { _creating.erase(spec); });

        auto instance = create_instance(spec, resolve(spec));
        _cache.insert_or_assign(spec, instance);
        _by_id.insert_or_assign(instance->id(), instance);
        _creation_order.push_back(spec);
        _create_emitter.emit(instance);
        return instance;
    }

    instance_ptr Container::get(std::string_view id) const {
        auto it = _by_id.find(id);
        return it == _by_id.end() ? nullptr : it->second;
    }

    instance_ptr Container::try_get(const spec_ptr &spec) const {
        if (auto it = _cache.find(spec); it != _cache.end()) { return it->second; }
        if (_parent && _overrides.empty()) { return _parent->try_get(spec); }
        return nullptr;
    }

    instance_ptr Container::create(const spec_ptr &spec) {
        // A setup that creates its own spec would otherwise recurse without bound.
        if (_creating.contains(spec)) { throw CircularDependencyError(spec->name()); }
        _creating.insert(spec);
        auto done = make_scope_exit([this, &spec] { _creating.erase(spec); });
        return create_instance(spec, resolve(spec));
    }

    instance_ptr Container::create_instance(const spec_ptr &key, const spec_ptr &mapped) {
        auto instance = untrack([this, &mapped] { return run_chain(mapped); });
        if (!instance) { throw_error<StoreError>("Middleware returned no instance for store '{}'", mapped->name()); }

        static_cast<void>(instance->on_dispose(
            [weak_self = weak_from_this(), key, weak_instance = std::weak_ptr<StoreInstance>(instance)] {
                auto self = weak_self.lock();
                auto disposed = weak_instance.lock();
                if (self && disposed) { self->forget(key, disposed); }
            }));
        return instance;
    }

    instance_ptr Container::run_chain(const spec_ptr &spec) {
        Next chain = [this](const spec_ptr &s) {
            return StoreInstance::create(s, *this,
                                         InstanceOptions{.clock = _options.clock,
                                                         .grace_period = _options.grace_period});
        };
        for (const auto &middleware: std::views::reverse(_options.middleware)) {
            chain = [&middleware, next = std::move(chain)](const spec_ptr &s) { return middleware(s, next); };
        }
        return chain(spec);
    }

    void Container::forget(const spec_ptr &key, const instance_ptr &instance) {
        _dispose_emitter.emit(instance);
        if (auto it = _cache.find(key); it != _cache.end() && it->second == instance) {
            _cache.erase(it);
            std::erase(_creation_order, key);
        }
        if (auto it = _by_id.find(instance->id()); it != _by_id.end() && it->second == instance) { _by_id.erase(it); }
    }

    void Container::set(const spec_ptr &spec, spec_ptr override_spec) {
        _overrides.insert_or_assign(spec, std::move(override_spec));
        if (auto it = _cache.find(spec); it != _cache.end()) {
            auto existing = it->second;
            existing->dispose();
        }
    }

    bool Container::has(const spec_ptr &spec) const {
        if (_cache.contains(spec)) { return true; }
        return _parent && _overrides.empty() && _parent->has(spec);
    }

    bool Container::dispose(const spec_ptr &spec) {
        auto it = _cache.find(spec);
        if (it == _cache.end()) { return false; }
        auto instance = it->second;
        instance->dispose();
        return true;
    }

    void Container::clear() {
        auto order = _creation_order;
        for (const auto &spec: std::views::reverse(order)) {
            if (auto it = _cache.find(spec); it != _cache.end()) {
                auto instance = it->second;
                instance->dispose();
            }
        }
        _cache.clear();
        _by_id.clear();
        _creation_order.clear();
        _services.clear();
    }

    std::shared_ptr<void> Container::get_service(const factory_definition_ptr &factory) {
        if (auto it = _services.find(factory); it != _services.end()) { return it->second; }
        if (_parent && _service_overrides.empty()) {
            if (auto inherited = _parent->try_get_service(factory)) { return inherited; }
        }

        auto service = create_service(factory);
        _services.insert_or_assign(factory, service);
        return service;
    }

    std::shared_ptr<void> Container::try_get_service(const factory_definition_ptr &factory) const {
        if (auto it = _services.find(factory); it != _services.end()) { return it->second; }
        if (_parent && _service_overrides.empty()) { return _parent->try_get_service(factory); }
        return nullptr;
    }

    std::shared_ptr<void> Container::create_service(const factory_definition_ptr &factory) {
        if (_creating_services.contains(factory)) { throw CircularDependencyError(factory->name); }
        _creating_services.insert(factory);
        auto done = make_scope_exit([this, &factory] { _creating_services.erase(factory); });

        auto it = _service_overrides.find(factory);
        auto mapped = it == _service_overrides.end() ? factory : it->second;
        auto service = untrack([this, &mapped] { return mapped->create(*this); });
        if (!service) { throw_error<StoreError>("Factory '{}' returned no instance", mapped->name); }
        return service;
    }

    void Container::set_service(const factory_definition_ptr &factory, factory_definition_ptr override_factory) {
        _service_overrides.insert_or_assign(factory, std::move(override_factory));
        _services.erase(factory);
    }

    container_ptr Container::scope(ScopeOptions options) {
        ContainerOptions scoped{
            .middleware = options.middleware ? with_defaults(std::move(*options.middleware)) : _options.middleware,
            .clock = _options.clock,
            .grace_period = _options.grace_period,
        };
        return container_ptr(new Container(std::move(scoped), shared_from_this()));
    }

    Unsubscribe Container::on_create(instance_listener listener) { return _create_emitter.on(std::move(listener)); }

    Unsubscribe Container::on_dispose(instance_listener listener) { return _dispose_emitter.on(std::move(listener)); }

    std::vector<instance_ptr> Container::instances() const {
        std::vector<instance_ptr> result;
        result.reserve(_creation_order.size());
        for (const auto &spec: _creation_order) {
            if (auto it = _cache.find(spec); it != _cache.end()) { result.push_back(it->second); }
        }
        return result;
    }

} // namespace rstore
