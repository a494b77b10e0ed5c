#ifndef RSTORE_UTIL_SCOPE_H
#define RSTORE_UTIL_SCOPE_H

#include <functional>
#include <type_traits>
#include <utility>

namespace rstore {
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)), active_(true) {
        }

        scope_exit(scope_exit &&other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        bool active_;
    };

    template<class F>
    scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }

    /**
     * Invoke fn, then finish, whether fn returns or throws. Unlike scope_exit, finish may throw: an exception from
     * finish replaces the one raised by fn.
     */
    template<class Fn, class Finish>
    std::invoke_result_t<Fn> invoke_finally(Fn &&fn, Finish &&finish) {
        using result_t = std::invoke_result_t<Fn>;
        if constexpr (std::is_void_v<result_t>) {
            try {
                std::invoke(std::forward<Fn>(fn));
            } catch (...) {
                finish();
                throw;
            }
            finish();
        } else {
            result_t result = [&]() -> result_t {
                try {
                    return std::invoke(std::forward<Fn>(fn));
                } catch (...) {
                    finish();
                    throw;
                }
            }();
            finish();
            return result;
        }
    }
} // namespace rstore
#endif  // RSTORE_UTIL_SCOPE_H
