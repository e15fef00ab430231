#ifndef ROLLOUT_HUMAN_READABLE_FORMATTER_HPP
#define ROLLOUT_HUMAN_READABLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <sstream>

namespace rollout {
    class HumanReadableFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            oss << formatTimestamp(entry.timestamp) << " "
                << "[" << getLevelString(entry.level) << "] "
                << entry.message;

            if (!entry.file.empty()) {
                oss << " [" << entry.file << ":" << entry.line << " " << entry.function << "]";
            }

            return oss.str();
        }
    };
} // namespace rollout

#endif // ROLLOUT_HUMAN_READABLE_FORMATTER_HPP
