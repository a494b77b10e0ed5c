#ifndef RSTORE_UTIL_ERRORS
#define RSTORE_UTIL_ERRORS

#include <rstore/rstore_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rstore {

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Root of every error raised by the library itself. User exceptions thrown from setup functions, actions and
     * effects pass through unchanged.
     */
    struct RSTORE_EXPORT StoreError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A setup-only operation (dependency resolution, child creation, effect registration, mixins, focus) was used
     * after the owning setup function returned.
     */
    struct RSTORE_EXPORT SetupPhaseError : StoreError {
        explicit SetupPhaseError(std::string_view method, std::string_view hint = {});
    };

    struct RSTORE_EXPORT CircularDependencyError : StoreError {
        explicit CircularDependencyError(std::string_view spec_name);

        [[nodiscard]] const std::string &spec_name() const { return _spec_name; }

    private:
        std::string _spec_name;
    };

    /**
     * A keepAlive store tried to depend on (or create) an autoDispose store.
     */
    struct RSTORE_EXPORT LifetimeMismatchError : StoreError {
        LifetimeMismatchError(std::string_view parent_name, std::string_view child_name, std::string_view operation);

        [[nodiscard]] const std::string &parent_name() const { return _parent_name; }
        [[nodiscard]] const std::string &child_name() const { return _child_name; }

    private:
        std::string _parent_name;
        std::string _child_name;
    };

    struct RSTORE_EXPORT DisposedInstanceError : StoreError {
        explicit DisposedInstanceError(std::string_view store_id);
    };

    struct RSTORE_EXPORT HooksContextError : StoreError {
        HooksContextError(std::string_view method, std::string_view required_context);
    };

    struct RSTORE_EXPORT AsyncFunctionError : StoreError {
        AsyncFunctionError(std::string_view context, std::string_view hint);
    };

    struct RSTORE_EXPORT UnknownPropertyError : StoreError {
        UnknownPropertyError(std::string_view store_id, std::string_view property);
    };

    struct RSTORE_EXPORT UnknownActionError : StoreError {
        UnknownActionError(std::string_view store_id, std::string_view action);
    };

} // namespace rstore

#endif // RSTORE_UTIL_ERRORS
