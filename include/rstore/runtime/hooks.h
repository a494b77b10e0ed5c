#pragma once

/**
 * @file hooks.h
 * @brief Scoped interception of state reads, writes, notifications and effect starts.
 *
 * Exactly one Hooks object is current per thread. with_hooks() installs another for the duration of a call and
 * restores the previous one on the way out, whether the call returns or throws. Hook sets compose by delegation:
 * a new set holds a reference to the one it replaced and forwards whatever it does not handle itself.
 */

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>
#include <rstore/runtime/effect_options.h>
#include <rstore/types/value.h>
#include <rstore/util/scope.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rstore {

    // Subscribes a listener to changes of whatever was read; returns the unsubscribe.
    using SubscribeFn = std::function<Unsubscribe(Notification)>;

    /**
     * A tracked read. key identifies the dependency: "<store id>.<property>" for state reads, "pick:<n>" for the
     * virtual dependency registered by pick(). store_id and prop are empty for virtual dependencies.
     */
    struct ReadEvent {
        std::string key;
        std::string store_id;
        std::string prop;
        Value value;
        SubscribeFn subscribe;
    };

    struct WriteEvent {
        std::string key;
        std::string store_id;
        std::string prop;
        Value next;
        Value prev;
    };

    /**
     * The interception interface. Every method has a usable default, so implementations override only what they
     * intercept. tracks_reads()/tracks_writes() let producers skip building events nobody listens to.
     */
    struct RSTORE_EXPORT Hooks {
        Hooks() = default;
        Hooks(const Hooks &) = delete;
        Hooks &operator=(const Hooks &) = delete;
        virtual ~Hooks() = default;

        [[nodiscard]] virtual bool tracks_reads() const { return false; }

        [[nodiscard]] virtual bool tracks_writes() const { return false; }

        virtual void on_read(const ReadEvent &event) {}

        virtual void on_write(const WriteEvent &event) {}

        /**
         * Deliver a notification. key groups notifications that supersede each other (nullptr never groups); the
         * default delivers immediately.
         */
        virtual void schedule_notification(Notification notify, const void *key);

        // The default starts the effect at once; its disposer is dropped.
        virtual void schedule_effect(EffectRunner runner);
    };

    /**
     * Forwards everything to the hooks it was layered over.
     */
    struct RSTORE_EXPORT HooksDelegate : Hooks {
        explicit HooksDelegate(Hooks &previous) : _previous{previous} {}

        [[nodiscard]] bool tracks_reads() const override { return _previous.tracks_reads(); }

        [[nodiscard]] bool tracks_writes() const override { return _previous.tracks_writes(); }

        void on_read(const ReadEvent &event) override { _previous.on_read(event); }

        void on_write(const WriteEvent &event) override { _previous.on_write(event); }

        void schedule_notification(Notification notify, const void *key) override {
            _previous.schedule_notification(std::move(notify), key);
        }

        void schedule_effect(EffectRunner runner) override { _previous.schedule_effect(std::move(runner)); }

        [[nodiscard]] Hooks &previous() const { return _previous; }

    private:
        Hooks &_previous;
    };

    /**
     * Partial replacement of the current hooks. An empty optional inherits the current behaviour. For on_read and
     * on_write an engaged but empty function switches interception off; the scheduling members cannot be switched
     * off, an empty function there also inherits.
     */
    struct HookPatch {
        std::optional<std::function<void(const ReadEvent &)> > on_read;
        std::optional<std::function<void(const WriteEvent &)> > on_write;
        std::optional<std::function<void(Notification, const void *)> > schedule_notification;
        std::optional<std::function<void(EffectRunner)> > schedule_effect;
    };

    struct RSTORE_EXPORT PatchedHooks : HooksDelegate {
        PatchedHooks(Hooks &previous, HookPatch patch);

        [[nodiscard]] bool tracks_reads() const override;

        [[nodiscard]] bool tracks_writes() const override;

        void on_read(const ReadEvent &event) override;

        void on_write(const WriteEvent &event) override;

        void schedule_notification(Notification notify, const void *key) override;

        void schedule_effect(EffectRunner runner) override;

    private:
        HookPatch _patch;
    };

    [[nodiscard]] RSTORE_EXPORT Hooks &current_hooks();

    /**
     * Installs hooks for the lifetime of the scope.
     */
    class RSTORE_EXPORT HookScope {
    public:
        explicit HookScope(Hooks &hooks);

        HookScope(const HookScope &) = delete;
        HookScope &operator=(const HookScope &) = delete;

        ~HookScope();

    private:
        Hooks *_previous;
    };

    template<typename Fn>
    std::invoke_result_t<Fn> with_hooks(Hooks &hooks, Fn &&fn) {
        HookScope scope{hooks};
        return std::invoke(std::forward<Fn>(fn));
    }

    template<typename Fn>
    std::invoke_result_t<Fn> with_hooks(HookPatch patch, Fn &&fn) {
        PatchedHooks hooks{current_hooks(), std::move(patch)};
        return with_hooks(static_cast<Hooks &>(hooks), std::forward<Fn>(fn));
    }

    /**
     * Builder form: the builder receives the current hooks and returns the patch, so it can call through to them.
     */
    template<typename Builder, typename Fn>
        requires std::is_invocable_r_v<HookPatch, Builder, Hooks &>
    std::invoke_result_t<Fn> with_hooks(Builder &&builder, Fn &&fn) {
        auto &current = current_hooks();
        PatchedHooks hooks{current, std::invoke(std::forward<Builder>(builder), current)};
        return with_hooks(static_cast<Hooks &>(hooks), std::forward<Fn>(fn));
    }

    [[nodiscard]] inline bool is_tracking_reads() { return current_hooks().tracks_reads(); }

    [[nodiscard]] inline bool is_tracking_writes() { return current_hooks().tracks_writes(); }

    RSTORE_EXPORT void track_read(const ReadEvent &event);

    RSTORE_EXPORT void track_write(const WriteEvent &event);

    RSTORE_EXPORT void schedule_notification(Notification notify, const void *key = nullptr);

    RSTORE_EXPORT void schedule_effect(EffectRunner runner);

    /**
     * Run fn without recording reads or writes.
     */
    template<typename Fn>
    std::invoke_result_t<Fn> untrack(Fn &&fn) {
        return with_hooks(HookPatch{
                              .on_read = std::function<void(const ReadEvent &)>{},
                              .on_write = std::function<void(const WriteEvent &)>{},
                          },
                          std::forward<Fn>(fn));
    }

    /**
     * Collects notifications by key while installed. Insertion order is kept and the last notification for a key
     * wins. flush() delivers and forgets them.
     */
    struct RSTORE_EXPORT BatchHooks : HooksDelegate {
        using HooksDelegate::HooksDelegate;

        void schedule_notification(Notification notify, const void *key) override;

        void flush();

        [[nodiscard]] std::size_t pending() const { return _pending.size(); }

    private:
        std::vector<std::pair<const void *, Notification> > _pending;
        ankerl::unordered_dense::map<const void *, std::size_t> _index;
    };

    /**
     * Run fn with notifications deduplicated by key; they are delivered once fn finishes, even if it throws.
     */
    template<typename Fn>
    std::invoke_result_t<Fn> batch(Fn &&fn) {
        BatchHooks hooks{current_hooks()};
        return invoke_finally([&]() -> std::invoke_result_t<Fn> {
                                  return with_hooks(static_cast<Hooks &>(hooks), std::forward<Fn>(fn));
                              },
                              [&hooks] { hooks.flush(); });
    }

} // namespace rstore
