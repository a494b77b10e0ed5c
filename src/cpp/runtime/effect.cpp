#include <rstore/runtime/clock.h>
#include <rstore/runtime/effect.h>
#include <rstore/runtime/hooks.h>
#include <rstore/util/hash.h>
#include <rstore/util/logging.h>
#include <rstore/util/scope.h>

#include <cmath>

namespace rstore {

    engine_time_delta_t retry_delay(const RetryConfig &config, std::size_t attempt) {
        if (auto fn = std::get_if<RetryDelayFn>(&config.delay); fn && *fn) { return (*fn)(attempt); }
        if (auto fixed = std::get_if<engine_time_delta_t>(&config.delay)) { return *fixed; }
        return milliseconds(static_cast<int64_t>(100 * std::pow(2.0, static_cast<double>(attempt))));
    }

    namespace detail {
        void EffectRun::run_cleanups() {
            if (stale) { return; }
            stale = true;
            if (token) {
                token->cancel();
                token.reset();
            }
            if (!cleanups.empty()) { cleanups.emit_and_clear_lifo(); }
        }
    } // namespace detail

    cancellation_token_ptr EffectContext::cancellation() {
        if (!_run->token) {
            _run->token = std::make_shared<CancellationToken>();
            if (_run->stale) { _run->token->cancel(); }
        }
        return _run->token;
    }

    Unsubscribe EffectContext::on_cleanup(std::function<void()> cleanup) {
        return _run->cleanups.on(std::move(cleanup));
    }

    namespace {
        template<class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        /**
         * One effect: the body, its dependency bookkeeping and its error policy. Kept alive by its disposer and by
         * the listeners it registers with its dependencies.
         */
        class Effect : public std::enable_shared_from_this<Effect> {
        public:
            Effect(EffectBody body, EffectOptions options) : _body{std::move(body)}, _options{std::move(options)} {}

            void start(const RunEffectOptions &run_options) {
                if (_started) { return; }
                _started = true;
                if (_options.on_error) {
                    _strategy = *_options.on_error;
                } else if (run_options.default_strategy) {
                    _strategy = *run_options.default_strategy;
                }
                _on_error = run_options.on_error;
                _clock = _options.clock ? _options.clock : run_options.clock;
                execute();
            }

            void execute();

            void dispose();

        private:
            struct TrackedDep {
                Value value;
                SubscribeFn subscribe;
            };

            using dep_map = string_map<TrackedDep>;

            // Records reads and writes of the running body, forwarding them to the hooks it is layered over.
            struct TrackingHooks : HooksDelegate {
                TrackingHooks(Hooks &previous, Effect &effect) : HooksDelegate{previous}, _effect{effect} {}

                [[nodiscard]] bool tracks_reads() const override { return true; }

                [[nodiscard]] bool tracks_writes() const override { return true; }

                void on_read(const ReadEvent &event) override {
                    HooksDelegate::on_read(event);
                    _effect._new_deps.try_emplace(event.key, TrackedDep{event.value, event.subscribe});
                }

                void on_write(const WriteEvent &event) override {
                    HooksDelegate::on_write(event);
                    _effect._written.insert(event.key);
                }

            private:
                Effect &_effect;
            };

            [[nodiscard]] static bool deps_changed(const dep_map &prev, const dep_map &next) {
                if (prev.size() != next.size()) { return true; }
                for (const auto &[key, _]: next) {
                    if (!prev.contains(key)) { return true; }
                }
                return false;
            }

            [[nodiscard]] static bool keys_changed(const string_set &prev, const string_set &next) {
                if (prev.size() != next.size()) { return true; }
                for (const auto &key: next) {
                    if (!prev.contains(key)) { return true; }
                }
                return false;
            }

            void subscribe_to_tracked_deps() {
                _subscribed_written = _written;
                for (const auto &[key, dep]: _deps) {
                    if (_written.contains(key)) { continue; }
                    _subscriptions.on(dep.subscribe([self = shared_from_this()] {
                        schedule_notification([self] { self->execute(); }, self.get());
                    }));
                }
            }

            void handle_error(std::exception_ptr error);

            [[nodiscard]] clock_s_ptr clock() const { return _clock ? _clock : default_clock(); }

            EffectBody _body;
            EffectOptions _options;
            EffectErrorStrategy _strategy{KeepAlive{}};
            std::function<void(std::exception_ptr)> _on_error;
            clock_s_ptr _clock;

            bool _started{false};
            bool _running{false};
            bool _disposed{false};
            std::size_t _generation{0};
            std::size_t _retry_count{0};
            std::optional<Clock::alarm_id> _retry_alarm;

            std::shared_ptr<detail::EffectRun> _run;

            dep_map _deps;
            dep_map _new_deps;
            string_set _written;
            // The written set the current subscriptions were built against.
            string_set _subscribed_written;
            Emitter<> _subscriptions;

            // The last good run, restored by KeepAlive when a re-run fails.
            dep_map _prev_deps;
            Emitter<> _prev_subscriptions;
        };

        void Effect::execute() {
            if (_disposed || _running) { return; }
            _running = true;
            auto self = shared_from_this();
            auto reset_running = make_scope_exit([this] { _running = false; });

            const auto generation = ++_generation;
            try {
                if (auto run = std::move(_run)) { run->run_cleanups(); }

                if (!_subscriptions.empty()) {
                    _prev_deps = _deps;
                    _prev_subscriptions = std::exchange(_subscriptions, Emitter<>{});
                }

                _new_deps.clear();
                _written.clear();

                _run = std::make_shared<detail::EffectRun>(generation);
                EffectContext context{_run};
                TrackingHooks hooks{current_hooks(), *this};
                with_hooks(static_cast<Hooks &>(hooks), [&] { _body(context); });

                _retry_count = 0;

                if (deps_changed(_deps, _new_deps) || keys_changed(_subscribed_written, _written)) {
                    _prev_subscriptions.emit_and_clear();
                    _deps = std::move(_new_deps);
                    _new_deps.clear();
                    subscribe_to_tracked_deps();
                } else if (!_prev_subscriptions.empty()) {
                    _subscriptions = std::exchange(_prev_subscriptions, Emitter<>{});
                }

                _prev_deps.clear();
                _prev_subscriptions.clear();
            } catch (const AsyncFunctionError &) {
                throw;
            } catch (...) {
                handle_error(std::current_exception());
            }
        }

        void Effect::handle_error(std::exception_ptr error) {
            if (_on_error) { _on_error(error); }

            std::visit(overloaded{
                           [&](const FailFast &) {
                               _prev_subscriptions.emit_and_clear();
                               _prev_deps.clear();
                               std::rethrow_exception(error);
                           },
                           [&](const KeepAlive &) {
                               log_error("Effect error (keepAlive): {}", describe_exception(error));
                               if (!_prev_subscriptions.empty()) {
                                   _deps = std::move(_prev_deps);
                                   _prev_deps.clear();
                                   _subscriptions = std::exchange(_prev_subscriptions, Emitter<>{});
                                   return;
                               }
                               if (!_new_deps.empty()) {
                                   _deps = std::move(_new_deps);
                                   _new_deps.clear();
                               }
                               subscribe_to_tracked_deps();
                           },
                           [&](const EffectErrorHandler &handler) {
                               if (!handler) { return; }
                               handler(EffectErrorContext{
                                   .error = error,
                                   .retry = [self = shared_from_this()] {
                                       ++self->_retry_count;
                                       self->execute();
                                   },
                                   .retry_count = _retry_count,
                               });
                           },
                           [&](const RetryConfig &config) {
                               if (_retry_count < config.max_retries) {
                                   auto delay = retry_delay(config, _retry_count);
                                   ++_retry_count;
                                   log_debug("Retrying effect in {}ms (attempt {} of {})", to_milliseconds(delay),
                                             _retry_count, config.max_retries);
                                   _retry_alarm = clock()->set_alarm(delay, [self = shared_from_this()] {
                                       self->_retry_alarm.reset();
                                       self->execute();
                                   });
                               } else {
                                   log_error("Effect failed after {} retries: {}", config.max_retries,
                                             describe_exception(error));
                               }
                           },
                       },
                       _strategy);
        }

        void Effect::dispose() {
            if (_disposed) { return; }
            _disposed = true;
            ++_generation;

            if (_retry_alarm) {
                clock()->cancel_alarm(*_retry_alarm);
                _retry_alarm.reset();
            }

            invoke_finally(
                [this] {
                    if (auto run = std::move(_run)) { run->run_cleanups(); }
                },
                [this] {
                    _subscriptions.emit_and_clear();
                    _prev_subscriptions.emit_and_clear();
                });
        }
    } // namespace

    namespace detail {
        Unsubscribe start_effect(EffectBody body, EffectOptions options) {
            auto fx = std::make_shared<Effect>(std::move(body), std::move(options));
            schedule_effect([fx](const RunEffectOptions &run_options) -> Unsubscribe {
                fx->start(run_options);
                return [fx] { fx->dispose(); };
            });
            return [fx] { fx->dispose(); };
        }
    } // namespace detail

} // namespace rstore
