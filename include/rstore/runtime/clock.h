#ifndef RSTORE_CLOCK_H
#define RSTORE_CLOCK_H

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/util/date_time.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace rstore {

    /**
     * Timer source for the deferred work in the library: effect retries and auto-dispose grace periods.
     *
     * Alarms are one-shot. They fire in (time, registration) order and a cancelled alarm never fires. Nothing fires
     * on its own: the owner of the clock drives it, either by advancing virtual time (SimulationClock) or by pumping
     * the wall clock (RealTimeClock).
     */
    struct RSTORE_EXPORT Clock {
        using alarm_id = uint64_t;
        using callback_type = std::function<void()>;

        Clock() = default;
        Clock(const Clock &) = delete;
        Clock &operator=(const Clock &) = delete;
        virtual ~Clock() = default;

        [[nodiscard]] virtual engine_time_t now() const = 0;

        alarm_id set_alarm(engine_time_delta_t delay, callback_type callback);

        // Unknown or already fired ids are ignored.
        void cancel_alarm(alarm_id id);

        [[nodiscard]] std::size_t pending_alarms() const { return _alarms.size(); }

        [[nodiscard]] std::optional<engine_time_t> next_alarm_time() const;

        /**
         * Fire every alarm due at or before now(), including alarms scheduled by the callbacks themselves that are
         * already due. Returns the number of alarms fired.
         */
        std::size_t fire_due_alarms();

    protected:
        // Fires the earliest alarm if it is due at or before the given time.
        bool fire_next(engine_time_t up_to);

    private:
        alarm_id _next_id{0};
        std::set<std::pair<engine_time_t, alarm_id> > _alarms;
        std::map<alarm_id, std::pair<engine_time_t, callback_type> > _alarm_callbacks;
    };

    /**
     * Virtual time. Time only moves when advanced, which makes timer driven behaviour deterministic in tests.
     */
    struct RSTORE_EXPORT SimulationClock : Clock {
        explicit SimulationClock(engine_time_t start_time = engine_time_t{});

        [[nodiscard]] engine_time_t now() const override { return _now; }

        /**
         * Move time forward, firing alarms in order. Each alarm observes now() equal to its own due time.
         */
        void advance(engine_time_delta_t delta);

        void advance_to(engine_time_t time);

        // Jump from alarm to alarm until none are pending.
        void run_until_idle();

    private:
        engine_time_t _now;
    };

    /**
     * Wall-clock time; the pumping calls sleep the calling thread until the next alarm is due.
     */
    struct RSTORE_EXPORT RealTimeClock : Clock {
        [[nodiscard]] engine_time_t now() const override;

        void run_until_idle();

        void run_for(engine_time_delta_t duration);
    };

    /**
     * The clock used when none is configured: one RealTimeClock per thread.
     */
    [[nodiscard]] RSTORE_EXPORT clock_s_ptr default_clock();

} // namespace rstore

#endif  // RSTORE_CLOCK_H
