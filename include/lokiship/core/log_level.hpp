#ifndef LOKISHIP_LEVEL_HPP
#define LOKISHIP_LEVEL_HPP

namespace lokiship {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    /// Lowercase level name, the form Loki's level detection expects.
    inline const char *getLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trace";
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::FATAL: return "fatal";
            default: return "unknown";
        }
    }
} // namespace lokiship

#endif // LOKISHIP_LEVEL_HPP
