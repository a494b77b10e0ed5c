#include <rstore/runtime/pick.h>

#include <fmt/format.h>

namespace rstore::detail {

    std::string next_pick_key() {
        static std::size_t counter{0};
        return fmt::format("pick:{}", ++counter);
    }

} // namespace rstore::detail
