#include <rstore/runtime/trace_hooks.h>
#include <rstore/util/logging.h>

namespace rstore {

    TraceHooks::TraceHooks(Hooks &previous, const std::optional<std::string> &filter, bool reads, bool writes,
                           bool effects)
        : HooksDelegate{previous}, _filter(filter), _reads(reads), _writes(writes), _effects(effects) {}

    bool TraceHooks::tracks_reads() const { return _reads || HooksDelegate::tracks_reads(); }

    bool TraceHooks::tracks_writes() const { return _writes || HooksDelegate::tracks_writes(); }

    bool TraceHooks::_should_log(const std::string &key) const {
        return !_filter || key.find(*_filter) != std::string::npos;
    }

    void TraceHooks::on_read(const ReadEvent &event) {
        if (_reads && _should_log(event.key)) { log_debug("[trace] read  {} = {}", event.key, event.value); }
        HooksDelegate::on_read(event);
    }

    void TraceHooks::on_write(const WriteEvent &event) {
        if (_writes && _should_log(event.key)) {
            log_debug("[trace] write {}: {} -> {}", event.key, event.prev, event.next);
        }
        HooksDelegate::on_write(event);
    }

    void TraceHooks::schedule_effect(EffectRunner runner) {
        if (_effects) { log_debug("[trace] effect scheduled"); }
        HooksDelegate::schedule_effect(std::move(runner));
    }

} // namespace rstore
