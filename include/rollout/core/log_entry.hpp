#ifndef ROLLOUT_LOG_ENTRY_HPP
#define ROLLOUT_LOG_ENTRY_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>
#include <vector>
#include <utility>

namespace rollout {
    struct LogEntry {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string templateStr;
        std::vector<std::pair<std::string, std::string> > arguments;

        // Source location, only filled in by the ROLLOUT_* macros.
        std::string file;
        int line;
        std::string function;
    };
} // namespace rollout

#endif // ROLLOUT_LOG_ENTRY_HPP
