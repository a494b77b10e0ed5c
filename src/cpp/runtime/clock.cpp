#include <rstore/runtime/clock.h>

#include <memory>
#include <stdexcept>
#include <thread>

namespace rstore {

    Clock::alarm_id Clock::set_alarm(engine_time_delta_t delay, callback_type callback) {
        if (delay < engine_time_delta_t::zero()) { delay = engine_time_delta_t::zero(); }
        auto id = ++_next_id;
        auto alarm_time = now() + delay;
        _alarms.emplace(alarm_time, id);
        _alarm_callbacks.emplace(id, std::make_pair(alarm_time, std::move(callback)));
        return id;
    }

    void Clock::cancel_alarm(alarm_id id) {
        auto it = _alarm_callbacks.find(id);
        if (it == _alarm_callbacks.end()) { return; }
        _alarms.erase({it->second.first, id});
        _alarm_callbacks.erase(it);
    }

    std::optional<engine_time_t> Clock::next_alarm_time() const {
        if (_alarms.empty()) { return std::nullopt; }
        return _alarms.begin()->first;
    }

    bool Clock::fire_next(engine_time_t up_to) {
        if (_alarms.empty()) { return false; }
        auto alarm = *_alarms.begin();
        if (alarm.first > up_to) { return false; }
        _alarms.erase(_alarms.begin());
        auto cb = _alarm_callbacks.find(alarm.second);
        if (cb != _alarm_callbacks.end()) {
            auto callback = std::move(cb->second.second);
            _alarm_callbacks.erase(cb);
            callback();
        }
        return true;
    }

    std::size_t Clock::fire_due_alarms() {
        std::size_t fired{0};
        while (fire_next(now())) { ++fired; }
        return fired;
    }

    SimulationClock::SimulationClock(engine_time_t start_time) : _now{start_time} {}

    void SimulationClock::advance(engine_time_delta_t delta) { advance_to(_now + delta); }

    void SimulationClock::advance_to(engine_time_t time) {
        if (time < _now) { throw std::invalid_argument("Cannot move a simulation clock backwards"); }
        while (true) {
            auto next = next_alarm_time();
            if (!next || *next > time) { break; }
            if (*next > _now) { _now = *next; }
            fire_next(_now);
        }
        _now = time;
    }

    void SimulationClock::run_until_idle() {
        while (auto next = next_alarm_time()) {
            if (*next > _now) { _now = *next; }
            fire_next(_now);
        }
    }

    engine_time_t RealTimeClock::now() const { return wall_clock_now(); }

    void RealTimeClock::run_until_idle() {
        while (auto next = next_alarm_time()) {
            std::this_thread::sleep_until(*next);
            fire_due_alarms();
        }
    }

    void RealTimeClock::run_for(engine_time_delta_t duration) {
        const auto end_time = now() + duration;
        while (true) {
            auto next = next_alarm_time();
            if (!next || *next > end_time) { break; }
            std::this_thread::sleep_until(*next);
            fire_due_alarms();
        }
        std::this_thread::sleep_until(end_time);
        fire_due_alarms();
    }

    clock_s_ptr default_clock() {
        thread_local clock_s_ptr clock = std::make_shared<RealTimeClock>();
        return clock;
    }

} // namespace rstore
