#include <rstore/types/equality.h>
#include <rstore/util/errors.h>

#include <algorithm>

namespace rstore {

    EqualityFn resolve_equality(const std::optional<Equality> &equality) {
        if (!equality) { return identical; }
        if (auto fn = std::get_if<EqualityFn>(&*equality)) {
            if (!*fn) { return identical; }
            return *fn;
        }
        switch (std::get<EqualityKind>(*equality)) {
            case EqualityKind::STRICT: return identical;
            case EqualityKind::SHALLOW: return shallow_equal;
            case EqualityKind::DEEP: return deep_equal;
        }
        return identical;
    }

    EqualityResolver::EqualityResolver(const std::optional<EqualityConfig> &config,
                                       const std::vector<std::string> &keys) {
        if (!config) { return; }
        _has_custom = true;

        if (auto single = std::get_if<Equality>(&*config)) {
            _by_index.assign(keys.size(), resolve_equality(*single));
            return;
        }

        const auto &per_property = std::get<PropertyEquality>(*config);
        for (const auto &[key, _]: per_property.properties) {
            if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
                throw_error<std::invalid_argument>("Equality configured for unknown state property '{}'", key);
            }
        }
        const auto fallback = resolve_equality(per_property.default_equality);
        _by_index.reserve(keys.size());
        for (const auto &key: keys) {
            auto it = per_property.properties.find(key);
            _by_index.push_back(it == per_property.properties.end() ? fallback : resolve_equality(it->second));
        }
    }

} // namespace rstore
