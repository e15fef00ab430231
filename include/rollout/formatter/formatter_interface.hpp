#ifndef ROLLOUT_FORMATTER_INTERFACE_HPP
#define ROLLOUT_FORMATTER_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include <string>

namespace rollout {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogEntry &entry) const = 0;
    };
} // namespace rollout

#endif // ROLLOUT_FORMATTER_INTERFACE_HPP
