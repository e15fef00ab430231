#ifndef ROLLOUT_JSON_FORMATTER_HPP
#define ROLLOUT_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace rollout {
    /// One JSON object per entry: level, timestamp, message, then each named
    /// template argument as its own string field.
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["level"] = getLevelString(entry.level);
            j["timestamp"] = formatTimestamp(entry.timestamp);
            j["message"] = entry.message;
            if (!entry.file.empty()) {
                j["source"] = {{"file", entry.file}, {"line", entry.line}, {"function", entry.function}};
            }
            for (const auto &arg: entry.arguments) {
                j[arg.first] = arg.second;
            }
            return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
    };
} // namespace rollout

#endif // ROLLOUT_JSON_FORMATTER_HPP
