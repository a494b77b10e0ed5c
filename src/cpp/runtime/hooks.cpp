#include <rstore/runtime/hooks.h>

namespace rstore {

    void Hooks::schedule_notification(Notification notify, const void *) { notify(); }

    void Hooks::schedule_effect(EffectRunner runner) {
        auto dispose = runner(RunEffectOptions{});
        static_cast<void>(dispose);
    }

    PatchedHooks::PatchedHooks(Hooks &previous, HookPatch patch) : HooksDelegate{previous}, _patch{std::move(patch)} {}

    bool PatchedHooks::tracks_reads() const {
        if (_patch.on_read) { return static_cast<bool>(*_patch.on_read); }
        return HooksDelegate::tracks_reads();
    }

    bool PatchedHooks::tracks_writes() const {
        if (_patch.on_write) { return static_cast<bool>(*_patch.on_write); }
        return HooksDelegate::tracks_writes();
    }

    void PatchedHooks::on_read(const ReadEvent &event) {
        if (!_patch.on_read) {
            HooksDelegate::on_read(event);
        } else if (*_patch.on_read) {
            (*_patch.on_read)(event);
        }
    }

    void PatchedHooks::on_write(const WriteEvent &event) {
        if (!_patch.on_write) {
            HooksDelegate::on_write(event);
        } else if (*_patch.on_write) {
            (*_patch.on_write)(event);
        }
    }

    void PatchedHooks::schedule_notification(Notification notify, const void *key) {
        if (_patch.schedule_notification && *_patch.schedule_notification) {
            (*_patch.schedule_notification)(std::move(notify), key);
        } else {
            HooksDelegate::schedule_notification(std::move(notify), key);
        }
    }

    void PatchedHooks::schedule_effect(EffectRunner runner) {
        if (_patch.schedule_effect && *_patch.schedule_effect) {
            (*_patch.schedule_effect)(std::move(runner));
        } else {
            HooksDelegate::schedule_effect(std::move(runner));
        }
    }

    namespace {
        Hooks &default_hooks() {
            thread_local Hooks hooks;
            return hooks;
        }

        Hooks *&current_slot() {
            thread_local Hooks *current{nullptr};
            return current;
        }
    } // namespace

    Hooks &current_hooks() {
        auto current = current_slot();
        return current != nullptr ? *current : default_hooks();
    }

    HookScope::HookScope(Hooks &hooks) : _previous{current_slot()} { current_slot() = &hooks; }

    HookScope::~HookScope() { current_slot() = _previous; }

    void track_read(const ReadEvent &event) {
        auto &hooks = current_hooks();
        if (hooks.tracks_reads()) { hooks.on_read(event); }
    }

    void track_write(const WriteEvent &event) {
        auto &hooks = current_hooks();
        if (hooks.tracks_writes()) { hooks.on_write(event); }
    }

    void schedule_notification(Notification notify, const void *key) {
        current_hooks().schedule_notification(std::move(notify), key);
    }

    void schedule_effect(EffectRunner runner) { current_hooks().schedule_effect(std::move(runner)); }

    void BatchHooks::schedule_notification(Notification notify, const void *key) {
        if (key == nullptr) {
            _pending.emplace_back(nullptr, std::move(notify));
            return;
        }
        auto [it, inserted] = _index.try_emplace(key, _pending.size());
        if (inserted) {
            _pending.emplace_back(key, std::move(notify));
        } else {
            _pending[it->second].second = std::move(notify);
        }
    }

    void BatchHooks::flush() {
        auto pending = std::move(_pending);
        _pending.clear();
        _index.clear();
        for (auto &[_, notify]: pending) { notify(); }
    }

} // namespace rstore
