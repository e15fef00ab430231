#ifndef ROLLOUT_ROTATOR_HPP
#define ROLLOUT_ROTATOR_HPP

#include "line_buffered_writer.hpp"
#include "retention_manager.hpp"
#include "sequence_allocator.hpp"
#include "../core/errors.hpp"
#include "../core/fs_utils.hpp"
#include "../core/journal_config.hpp"
#include "../logger.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <string>

namespace rollout {

    /// Hands a full journal off to a numbered rotated log.
    ///
    /// Rotation happens only when the journal has reached the size threshold
    /// AND its last byte is a newline. A line that crosses the threshold is
    /// finished in the same journal, so the threshold is a soft bound.
    class Rotator {
    public:
        Rotator(const JournalConfig& config, LineBufferedWriter& writer,
                RetentionManager& retention, Logger& logger)
            : m_config(config)
            , m_writer(writer)
            , m_retention(retention)
            , m_logger(logger)
            , m_rotations(0)
            , m_retentionFailures(0) {}

        bool shouldRotate() const {
            return m_writer.sizeBytes() >= m_config.maxSizeBytes() && m_writer.atBoundary();
        }

        /// Called after every append.
        bool maybeRotate() {
            if (!shouldRotate()) return false;
            rotateNow();
            return true;
        }

        /// Rotates unconditionally and returns the index given to the old journal.
        unsigned int rotateNow() {
            const std::string journal = m_config.journalPath();
            const std::uint64_t size = m_writer.isOpen() ? m_writer.sizeBytes() : detail::getFileSize(journal);

            m_writer.flush();
            m_writer.close();

            const unsigned int index = SequenceAllocator::nextIndex(m_config);
            const std::string name = SequenceAllocator::rotatedName(m_config.prefixName(), index);
            const std::string target = detail::joinPath(m_config.directory(), name);

            if (std::rename(journal.c_str(), target.c_str()) != 0) {
                throw detail::makeError(ErrorKind::Rename, "cannot rotate journal to", target, errno);
            }

            m_writer.open(journal, true);
            ++m_rotations;
            m_logger.info("Rotated journal to {file} ({bytes} bytes)", name, size);

            m_lastRetention = m_retention.enforce();
            m_retentionFailures += m_lastRetention.failed();
            return index;
        }

        unsigned int rotations() const { return m_rotations; }
        unsigned int retentionFailures() const { return m_retentionFailures; }
        const RetentionResult& lastRetention() const { return m_lastRetention; }

    private:
        const JournalConfig& m_config;
        LineBufferedWriter& m_writer;
        RetentionManager& m_retention;
        Logger& m_logger;
        unsigned int m_rotations;
        unsigned int m_retentionFailures;
        RetentionResult m_lastRetention;
    };

} // namespace rollout

#endif // ROLLOUT_ROTATOR_HPP
