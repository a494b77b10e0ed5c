#include <rstore/util/logging.h>

#include <cstdio>
#include <exception>

namespace rstore {

    namespace {
        LogSink &sink_slot() {
            static LogSink sink;
            return sink;
        }

        LogLevel &level_slot() {
            static LogLevel level{LogLevel::INFO};
            return level;
        }
    } // namespace

    void set_log_sink(LogSink sink) { sink_slot() = std::move(sink); }

    void set_log_level(LogLevel level) { level_slot() = level; }

    LogLevel log_level() { return level_slot(); }

    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARNING: return "warning";
            case LogLevel::ERROR: return "error";
        }
        return "unknown";
    }

    void log_message(LogLevel level, std::string_view message) {
        if (level < log_level()) { return; }
        auto &sink = sink_slot();
        if (sink) {
            sink(level, message);
        } else {
            fmt::print(stderr, "[rstore] {}: {}\n", to_string(level), message);
        }
    }

    std::string describe_exception(const std::exception_ptr &error) {
        if (!error) { return "<no exception>"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (const std::string &s) {
            return s;
        } catch (const char *s) {
            return s;
        } catch (...) {
            return "<non-standard exception>";
        }
    }

} // namespace rstore
