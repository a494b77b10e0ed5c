#pragma once

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace rstore {

    /**
     * Type-erased factory. The pointer is the identity a container caches and overrides by.
     */
    struct FactoryDefinition {
        std::string name;
        std::function<std::shared_ptr<void>(Container &)> create;
    };

    using factory_definition_ptr = std::shared_ptr<const FactoryDefinition>;

    /**
     * A plain service built from the container, e.g. an API client shared by several stores. Copies share identity.
     */
    template<typename T>
    class Factory {
    public:
        using value_type = T;
        using create_fn = std::function<std::shared_ptr<T>(Container &)>;

        Factory(std::string name, create_fn fn)
            : _definition{std::make_shared<const FactoryDefinition>(FactoryDefinition{
                .name = std::move(name),
                .create = [fn = std::move(fn)](Container &container) -> std::shared_ptr<void> {
                    return fn(container);
                },
            })} {}

        [[nodiscard]] const std::string &name() const { return _definition->name; }

        [[nodiscard]] const factory_definition_ptr &definition() const { return _definition; }

        friend bool operator==(const Factory &lhs, const Factory &rhs) { return lhs._definition == rhs._definition; }

    private:
        factory_definition_ptr _definition;
    };

    // Build a Factory<T> from fn(Container &) -> std::shared_ptr<T>.
    template<typename Fn>
        requires std::invocable<Fn &, Container &>
    auto factory(std::string name, Fn fn) {
        using result_t = std::invoke_result_t<Fn &, Container &>;
        using value_t = typename result_t::element_type;
        return Factory<value_t>{std::move(name), std::move(fn)};
    }

    // Objects with a dispose() member are disposed when their owning store is.
    template<typename T>
    concept Disposable = requires(T &t) { t.dispose(); };

} // namespace rstore
