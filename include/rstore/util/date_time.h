#ifndef RSTORE_DATE_TIME_H
#define RSTORE_DATE_TIME_H

#include <chrono>
#include <cstdint>

namespace rstore
{

    using engine_clock        = std::chrono::system_clock;
    using engine_time_t       = engine_clock::time_point;
    using engine_time_delta_t = std::chrono::microseconds;

    // Timers are expressed in milliseconds at the API surface.
    constexpr engine_time_delta_t milliseconds(int64_t ms) noexcept {
        return std::chrono::duration_cast<engine_time_delta_t>(std::chrono::milliseconds(ms));
    }

    constexpr int64_t to_milliseconds(engine_time_delta_t delta) noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
    }

    inline engine_time_t wall_clock_now() {
        return std::chrono::time_point_cast<engine_time_delta_t>(engine_clock::now());
    }

}  // namespace rstore
#endif  // RSTORE_DATE_TIME_H
