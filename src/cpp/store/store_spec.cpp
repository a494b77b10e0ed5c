#include <rstore/store/store_spec.h>

#include <fmt/format.h>

namespace rstore {

    std::string_view to_string(Lifetime lifetime) {
        switch (lifetime) {
            case Lifetime::KEEP_ALIVE: return "keepAlive";
            case Lifetime::AUTO_DISPOSE: return "autoDispose";
        }
        return "unknown";
    }

    namespace {
        std::size_t &spec_counter() {
            static std::size_t counter{0};
            return counter;
        }

        std::size_t &instance_counter() {
            static std::size_t counter{0};
            return counter;
        }
    } // namespace

    std::string generate_spec_name() { return fmt::format("spec-{}", ++spec_counter()); }

    std::string generate_store_id(std::string_view spec_name) {
        return fmt::format("{}:{}", spec_name, ++instance_counter());
    }

    void reset_generators() {
        spec_counter() = 0;
        instance_counter() = 0;
    }

    StoreSpec::StoreSpec(StoreOptions options)
        : _name{options.name.empty() ? generate_spec_name() : options.name},
          _options{std::move(options)},
          _initial_state{StateRecord::from_template(_options.state)},
          _equality{_options.equality, _initial_state->schema()->keys()} {}

    spec_ptr store(StoreOptions options) { return std::make_shared<const StoreSpec>(std::move(options)); }

} // namespace rstore
