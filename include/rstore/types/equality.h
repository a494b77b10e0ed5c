#pragma once

#include <rstore/rstore_export.h>
#include <rstore/types/value.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rstore {

    enum class EqualityKind : uint8_t {
        STRICT = 0,
        SHALLOW = 1,
        DEEP = 2
    };

    using EqualityFn = std::function<bool(const Value &, const Value &)>;

    // Either a named strategy or a custom comparison.
    using Equality = std::variant<EqualityKind, EqualityFn>;

    /**
     * Per-property equality configuration. Properties without an entry use default_equality, and strict identity
     * when that is empty too.
     */
    struct PropertyEquality {
        std::optional<Equality> default_equality;
        std::map<std::string, Equality, std::less<> > properties;
    };

    using EqualityConfig = std::variant<Equality, PropertyEquality>;

    [[nodiscard]] RSTORE_EXPORT EqualityFn resolve_equality(const std::optional<Equality> &equality);

    /**
     * Collapses a store's equality configuration into one comparison per property slot.
     *
     * When no configuration is supplied has_custom() is false and equal() reduces to identical(), which is the fast
     * path for the common case.
     */
    class RSTORE_EXPORT EqualityResolver {
    public:
        EqualityResolver() = default;

        EqualityResolver(const std::optional<EqualityConfig> &config, const std::vector<std::string> &keys);

        [[nodiscard]] bool has_custom() const { return _has_custom; }

        [[nodiscard]] bool equal(std::size_t index, const Value &lhs, const Value &rhs) const {
            if (!_has_custom) { return identical(lhs, rhs); }
            return _by_index[index](lhs, rhs);
        }

    private:
        bool _has_custom{false};
        std::vector<EqualityFn> _by_index;
    };

} // namespace rstore
