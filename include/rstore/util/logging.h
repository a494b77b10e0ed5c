#pragma once

#include <rstore/rstore_export.h>

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rstore {

    enum class LogLevel : uint8_t {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    using LogSink = std::function<void(LogLevel, std::string_view)>;

    /**
     * Replace the process-wide log sink. An empty sink restores the default, which writes
     * "[rstore] <level>: <message>" lines to stderr.
     */
    RSTORE_EXPORT void set_log_sink(LogSink sink);

    RSTORE_EXPORT void set_log_level(LogLevel level);

    [[nodiscard]] RSTORE_EXPORT LogLevel log_level();

    [[nodiscard]] RSTORE_EXPORT std::string_view to_string(LogLevel level);

    RSTORE_EXPORT void log_message(LogLevel level, std::string_view message);

    template<typename... Ts>
    void log(LogLevel level, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        if (level < log_level()) { return; }
        log_message(level, fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

    template<typename... Ts>
    void log_debug(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        log(LogLevel::DEBUG, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_warning(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        log(LogLevel::WARNING, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        log(LogLevel::ERROR, fmt_str, std::forward<Ts>(xs)...);
    }

    /**
     * Best-effort description of an in-flight exception, used when reporting errors that are recovered locally.
     */
    [[nodiscard]] RSTORE_EXPORT std::string describe_exception(const std::exception_ptr &error);

} // namespace rstore
