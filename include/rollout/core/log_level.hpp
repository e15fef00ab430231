#ifndef ROLLOUT_LOG_LEVEL_HPP
#define ROLLOUT_LOG_LEVEL_HPP

#include <string>
#include <cctype>

namespace rollout {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    /// Case-insensitive inverse of getLevelString(). Also accepts "warning".
    /// Returns false and leaves @p level untouched for unknown names.
    inline bool parseLevel(const std::string &name, LogLevel &level) {
        std::string lower;
        lower.reserve(name.size());
        for (size_t i = 0; i < name.size(); ++i) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        }

        if (lower == "trace") { level = LogLevel::TRACE; return true; }
        if (lower == "debug") { level = LogLevel::DEBUG; return true; }
        if (lower == "info") { level = LogLevel::INFO; return true; }
        if (lower == "warn" || lower == "warning") { level = LogLevel::WARN; return true; }
        if (lower == "error") { level = LogLevel::ERROR; return true; }
        if (lower == "fatal") { level = LogLevel::FATAL; return true; }
        return false;
    }
} // namespace rollout

#endif // ROLLOUT_LOG_LEVEL_HPP
