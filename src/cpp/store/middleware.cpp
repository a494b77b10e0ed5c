#include <rstore/store/middleware.h>
#include <rstore/store/store_spec.h>

#include <algorithm>
#include <ranges>

namespace rstore {

    namespace {
        std::function<bool(std::string_view)> name_matcher(const std::string &pattern) {
            const bool leading = pattern.starts_with('*');
            const bool trailing = pattern.size() > 1 && pattern.ends_with('*');
            if (leading && trailing) {
                return [infix = pattern.substr(1, pattern.size() - 2)](std::string_view name) {
                    return name.find(infix) != std::string_view::npos;
                };
            }
            if (leading) {
                return [suffix = pattern.substr(1)](std::string_view name) { return name.ends_with(suffix); };
            }
            if (trailing) {
                return [prefix = pattern.substr(0, pattern.size() - 1)](std::string_view name) {
                    return name.starts_with(prefix);
                };
            }
            return [pattern](std::string_view name) { return name == pattern; };
        }
    } // namespace

    SpecPredicate to_predicate(const SpecPattern &pattern) {
        if (const auto *re = std::get_if<std::regex>(&pattern)) {
            return [re = *re](const StoreSpec &spec) { return std::regex_search(spec.name(), re); };
        }
        return [matches = name_matcher(std::get<std::string>(pattern))](const StoreSpec &spec) {
            return matches(spec.name());
        };
    }

    SpecPredicate to_predicate(const std::vector<SpecPattern> &patterns) {
        std::vector<SpecPredicate> predicates;
        predicates.reserve(patterns.size());
        for (const auto &pattern: patterns) { predicates.push_back(to_predicate(pattern)); }
        return [predicates = std::move(predicates)](const StoreSpec &spec) {
            return std::ranges::any_of(predicates, [&spec](const SpecPredicate &p) { return p(spec); });
        };
    }

    Middleware compose(std::vector<Middleware> middlewares) {
        if (middlewares.empty()) {
            return [](const spec_ptr &spec, const Next &next) { return next(spec); };
        }
        if (middlewares.size() == 1) { return std::move(middlewares.front()); }
        return [middlewares = std::move(middlewares)](const spec_ptr &spec, const Next &next) {
            Next chain = next;
            for (const auto &middleware: std::views::reverse(middlewares)) {
                chain = [&middleware, inner = std::move(chain)](const spec_ptr &s) { return middleware(s, inner); };
            }
            return chain(spec);
        };
    }

    Middleware apply_for(SpecPredicate predicate, Middleware middleware) {
        return [predicate = std::move(predicate), middleware = std::move(middleware)](
            const spec_ptr &spec, const Next &next) {
            return predicate(*spec) ? middleware(spec, next) : next(spec);
        };
    }

    Middleware apply_for(const SpecPattern &pattern, Middleware middleware) {
        return apply_for(to_predicate(pattern), std::move(middleware));
    }

    Middleware apply_for(const std::vector<SpecPattern> &patterns, Middleware middleware) {
        return apply_for(to_predicate(patterns), std::move(middleware));
    }

    Middleware apply_except(SpecPredicate predicate, Middleware middleware) {
        return apply_for([predicate = std::move(predicate)](const StoreSpec &spec) { return !predicate(spec); },
                         std::move(middleware));
    }

    Middleware apply_except(const SpecPattern &pattern, Middleware middleware) {
        return apply_except(to_predicate(pattern), std::move(middleware));
    }

    Middleware apply_except(const std::vector<SpecPattern> &patterns, Middleware middleware) {
        return apply_except(to_predicate(patterns), std::move(middleware));
    }

} // namespace rstore
