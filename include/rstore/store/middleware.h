#pragma once

#include <rstore/rstore_export.h>
#include <rstore/store/container.h>

#include <functional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace rstore {

    /**
     * Matches spec names. Strings support a leading and/or trailing '*' wildcard:
     * "user*" (prefix), "*Store" (suffix), "*auth*" (substring); anything else is an exact match.
     */
    using SpecPattern = std::variant<std::string, std::regex>;

    using SpecPredicate = std::function<bool(const StoreSpec &)>;

    [[nodiscard]] RSTORE_EXPORT SpecPredicate to_predicate(const SpecPattern &pattern);

    // True when any of the patterns match.
    [[nodiscard]] RSTORE_EXPORT SpecPredicate to_predicate(const std::vector<SpecPattern> &patterns);

    // First middleware is outermost. An empty list passes straight through.
    [[nodiscard]] RSTORE_EXPORT Middleware compose(std::vector<Middleware> middlewares);

    [[nodiscard]] RSTORE_EXPORT Middleware apply_for(SpecPredicate predicate, Middleware middleware);

    [[nodiscard]] RSTORE_EXPORT Middleware apply_for(const SpecPattern &pattern, Middleware middleware);

    [[nodiscard]] RSTORE_EXPORT Middleware apply_for(const std::vector<SpecPattern> &patterns, Middleware middleware);

    // Applies middleware to every spec the predicate or patterns do not match.
    [[nodiscard]] RSTORE_EXPORT Middleware apply_except(SpecPredicate predicate, Middleware middleware);

    [[nodiscard]] RSTORE_EXPORT Middleware apply_except(const SpecPattern &pattern, Middleware middleware);

    [[nodiscard]] RSTORE_EXPORT Middleware apply_except(const std::vector<SpecPattern> &patterns,
                                                        Middleware middleware);

} // namespace rstore
