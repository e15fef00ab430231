#ifndef ROLLOUT_RETENTION_MANAGER_HPP
#define ROLLOUT_RETENTION_MANAGER_HPP

#include "sequence_allocator.hpp"
#include "../core/errors.hpp"
#include "../core/fs_utils.hpp"
#include "../core/journal_config.hpp"
#include "../logger.hpp"
#include <cerrno>
#include <cstdio>
#include <string>
#include <vector>

namespace rollout {

    struct RetentionResult {
        unsigned int removed;
        std::vector<RolloutError> errors;

        RetentionResult() : removed(0) {}

        unsigned int failed() const { return static_cast<unsigned int>(errors.size()); }
    };

    /// Keeps at most keepCount rotated logs, deleting the lowest indices.
    ///
    /// Failures are collected and logged, never thrown: losing the ability
    /// to prune old files degrades disk usage but does not put the active
    /// journal at risk.
    class RetentionManager {
    public:
        RetentionManager(const JournalConfig& config, Logger& logger)
            : m_config(config), m_logger(logger) {}

        RetentionResult enforce() {
            RetentionResult result;
            const unsigned int keep = m_config.keepCount();
            if (keep == 0) return result;

            std::vector<RotatedLog> logs;
            try {
                logs = SequenceAllocator::rotatedLogs(m_config);
            } catch (const RolloutError& e) {
                m_logger.warn("Retention skipped: {reason}", e.what());
                result.errors.push_back(RolloutError(ErrorKind::Delete, e.path(), e.errorCode(), e.what()));
                return result;
            }

            if (logs.size() <= keep) return result;

            const size_t excess = logs.size() - keep;
            for (size_t i = 0; i < excess; ++i) {
                const std::string& name = logs[i].name;
                std::string path = detail::joinPath(m_config.directory(), name);
                if (std::remove(path.c_str()) == 0) {
                    ++result.removed;
                    m_logger.debug("Removed expired log {file}", name);
                } else {
                    RolloutError err = detail::makeError(ErrorKind::Delete, "cannot delete", path, errno);
                    m_logger.warn("Retention: {reason}", err.what());
                    result.errors.push_back(err);
                }
            }
            return result;
        }

    private:
        const JournalConfig& m_config;
        Logger& m_logger;
    };

} // namespace rollout

#endif // ROLLOUT_RETENTION_MANAGER_HPP
