#ifndef ROLLOUT_STARTUP_RECOVERY_HPP
#define ROLLOUT_STARTUP_RECOVERY_HPP

#include "line_buffered_writer.hpp"
#include "rotator.hpp"
#include "../core/errors.hpp"
#include "../core/fs_utils.hpp"
#include "../core/journal_config.hpp"
#include "../logger.hpp"
#include <cerrno>
#include <cstdint>
#include <string>

namespace rollout {

    enum class RecoveryOutcome {
        Created,
        Resumed,
        RotatedOnStart
    };

    inline const char* getRecoveryOutcomeString(RecoveryOutcome outcome) {
        switch (outcome) {
            case RecoveryOutcome::Created: return "created";
            case RecoveryOutcome::Resumed: return "resumed";
            case RecoveryOutcome::RotatedOnStart: return "rotated-on-start";
            default: return "unknown";
        }
    }

    /// Brings the journal into a writable state before any input is read.
    class StartupRecovery {
    public:
        StartupRecovery(const JournalConfig& config, LineBufferedWriter& writer,
                        Rotator& rotator, Logger& logger)
            : m_config(config)
            , m_writer(writer)
            , m_rotator(rotator)
            , m_logger(logger) {}

        RecoveryOutcome run() {
            const std::string journal = m_config.journalPath();

            if (!detail::pathExists(journal)) {
                m_writer.open(journal, false);
                m_logger.info("Started new journal {path}", journal);
                return RecoveryOutcome::Created;
            }

            if (detail::isDirectory(journal)) {
                throw detail::makeError(ErrorKind::Open, "cannot open journal", journal, EISDIR);
            }

            const std::uint64_t size = detail::getFileSize(journal);

            if (size > 0 && m_config.rotatesOnStart()) {
                unsigned int index = m_rotator.rotateNow();
                m_logger.info("Rotated leftover journal ({bytes} bytes) to index {index}", size, index);
                return RecoveryOutcome::RotatedOnStart;
            }

            bool atBoundary = true;
            if (size > 0) {
                char last = 0;
                if (!detail::readLastByte(journal, last)) {
                    throw detail::makeError(ErrorKind::Open, "cannot read journal", journal, errno);
                }
                atBoundary = last == '\n';
            }

            m_writer.open(journal, false);
            m_writer.resume(size, atBoundary);
            m_logger.debug("Resumed journal {path} at {bytes} bytes (line boundary: {boundary})",
                           journal, size, atBoundary ? "yes" : "no");
            return RecoveryOutcome::Resumed;
        }

    private:
        const JournalConfig& m_config;
        LineBufferedWriter& m_writer;
        Rotator& m_rotator;
        Logger& m_logger;
    };

} // namespace rollout

#endif // ROLLOUT_STARTUP_RECOVERY_HPP
