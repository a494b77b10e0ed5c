#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rstore {

    // Transparent string hash so string_view keys can be looked up without allocating.
    struct string_hash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
            return ankerl::unordered_dense::hash<std::string_view>{}(str);
        }
    };

    // Insertion ordered while nothing is erased.
    template<typename V>
    using string_map = ankerl::unordered_dense::map<std::string, V, string_hash, std::equal_to<> >;

    using string_set = ankerl::unordered_dense::set<std::string, string_hash, std::equal_to<> >;

} // namespace rstore
