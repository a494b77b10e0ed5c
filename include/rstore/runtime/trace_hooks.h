#pragma once

#include <rstore/runtime/hooks.h>

#include <optional>
#include <string>

namespace rstore {

    /**
     * @brief Logs reads, writes and effect starts at debug level while installed.
     *
     * This is voluminous but can be helpful tracing down unexpected re-runs. Everything is forwarded to the hooks
     * it is layered over, so tracing composes with dependency tracking.
     */
    class RSTORE_EXPORT TraceHooks : public HooksDelegate {
    public:
        /**
         * @param previous The hooks to forward to
         * @param filter Used to restrict which stores are reported (substring match on the dependency key)
         * @param reads Log reads
         * @param writes Log writes
         * @param effects Log effect scheduling
         */
        explicit TraceHooks(Hooks &previous, const std::optional<std::string> &filter = std::nullopt,
                            bool reads = true, bool writes = true, bool effects = true);

        [[nodiscard]] bool tracks_reads() const override;

        [[nodiscard]] bool tracks_writes() const override;

        void on_read(const ReadEvent &event) override;

        void on_write(const WriteEvent &event) override;

        void schedule_effect(EffectRunner runner) override;

    private:
        std::optional<std::string> _filter;
        bool _reads;
        bool _writes;
        bool _effects;

        [[nodiscard]] bool _should_log(const std::string &key) const;
    };

    template<typename Fn>
    std::invoke_result_t<Fn> with_trace(Fn &&fn, const std::optional<std::string> &filter = std::nullopt) {
        TraceHooks hooks{current_hooks(), filter};
        return with_hooks(static_cast<Hooks &>(hooks), std::forward<Fn>(fn));
    }

} // namespace rstore
