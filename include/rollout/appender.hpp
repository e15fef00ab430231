#ifndef ROLLOUT_APPENDER_HPP
#define ROLLOUT_APPENDER_HPP

#include "core/errors.hpp"
#include "core/journal_config.hpp"
#include "io/input_reader.hpp"
#include "journal/line_buffered_writer.hpp"
#include "journal/retention_manager.hpp"
#include "journal/rotator.hpp"
#include "journal/startup_recovery.hpp"
#include "logger.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace rollout {

    enum class AppenderState {
        Starting,
        Running,
        Rotating,
        Terminated
    };

    inline const char* getAppenderStateString(AppenderState state) {
        switch (state) {
            case AppenderState::Starting: return "Starting";
            case AppenderState::Running: return "Running";
            case AppenderState::Rotating: return "Rotating";
            case AppenderState::Terminated: return "Terminated";
            default: return "Unknown";
        }
    }

    struct AppenderStats {
        std::uint64_t bytesWritten;
        unsigned int rotations;
        unsigned int retentionFailures;
        RecoveryOutcome recovery;

        AppenderStats()
            : bytesWritten(0)
            , rotations(0)
            , retentionFailures(0)
            , recovery(RecoveryOutcome::Created) {}
    };

    /// The read, append, rotate loop.
    ///
    /// Usage:
    /// @code
    ///   rollout::Logger logger;
    ///   rollout::Appender appender(config, logger);
    ///   rollout::FdInputReader input(STDIN_FILENO);
    ///   appender.run(input);
    /// @endcode
    ///
    /// Everything runs on the calling thread. Rotation and retention finish
    /// before the next read is issued. Any RolloutError thrown out of run()
    /// or feed() is fatal: the appender moves to Terminated and refuses
    /// further input.
    class Appender {
    public:
        Appender(const JournalConfig& config, Logger& logger)
            : m_config(config)
            , m_logger(logger)
            , m_retention(m_config, m_logger)
            , m_rotator(m_config, m_writer, m_retention, m_logger)
            , m_state(AppenderState::Starting)
            , m_failed(false) {
            m_config.validate();
        }

        Appender(const Appender&) = delete;
        Appender& operator=(const Appender&) = delete;

        /// Recovers the journal (unless start() was already called), then
        /// consumes @p reader until end of stream.
        AppenderStats run(IInputReader& reader) {
            if (m_state == AppenderState::Starting) {
                start();
            }

            std::vector<char> buffer(m_config.chunkBytes());
            try {
                for (;;) {
                    std::size_t n = reader.read(buffer.data(), buffer.size());
                    if (n == 0) break;
                    feed(buffer.data(), n);
                }
                m_writer.flush();
            } catch (...) {
                terminate(true);
                throw;
            }

            terminate(false);
            m_logger.debug("End of input after {bytes} bytes and {rotations} rotations",
                           m_stats.bytesWritten, m_stats.rotations);
            return m_stats;
        }

        /// Runs StartupRecovery. Called by run(); exposed for embedders that
        /// push data with feed() instead of supplying a reader.
        void start() {
            if (m_state != AppenderState::Starting) {
                throw std::logic_error("appender already started");
            }
            try {
                StartupRecovery recovery(m_config, m_writer, m_rotator, m_logger);
                m_stats.recovery = recovery.run();
                m_logger.debug("Journal recovery: {outcome}", getRecoveryOutcomeString(m_stats.recovery));
                syncCounters();
                m_state = AppenderState::Running;
                // A resumed journal may already be over the threshold and end
                // on a newline; hand it off before taking new input.
                afterAppend();
            } catch (...) {
                terminate(true);
                throw;
            }
        }

        /// Appends @p len bytes, rotating at every line boundary where the
        /// journal has reached the threshold.
        ///
        /// A chunk that crosses the threshold is cut right after the first
        /// newline at or past the crossing point, so the journal overshoots by
        /// at most the one line in progress regardless of how the input was
        /// chunked.
        void feed(const char* data, std::size_t len) {
            if (m_state != AppenderState::Running) {
                throw std::logic_error(std::string("appender is not running: ") +
                                       getAppenderStateString(m_state));
            }
            try {
                while (len > 0) {
                    std::size_t take = len;
                    const std::uint64_t size = m_writer.sizeBytes();
                    const std::uint64_t limit = m_config.maxSizeBytes();

                    if (size + len >= limit) {
                        std::size_t crossing = size >= limit ? 0 : static_cast<std::size_t>(limit - size - 1);
                        const void* nl = std::memchr(data + crossing, '\n', len - crossing);
                        if (nl) {
                            take = static_cast<std::size_t>(static_cast<const char*>(nl) - data) + 1;
                        }
                    }

                    m_writer.append(data, take);
                    m_stats.bytesWritten += take;
                    afterAppend();

                    data += take;
                    len -= take;
                }
            } catch (...) {
                terminate(true);
                throw;
            }
        }

        AppenderState state() const { return m_state; }
        bool failed() const { return m_failed; }
        const AppenderStats& stats() const { return m_stats; }
        const LineBufferedWriter& writer() const { return m_writer; }

    private:
        void afterAppend() {
            if (!m_rotator.shouldRotate()) return;
            m_state = AppenderState::Rotating;
            m_rotator.maybeRotate();
            syncCounters();
            m_state = AppenderState::Running;
        }

        void syncCounters() {
            m_stats.rotations = m_rotator.rotations();
            m_stats.retentionFailures = m_rotator.retentionFailures();
        }

        void terminate(bool failed) {
            m_state = AppenderState::Terminated;
            m_failed = failed;
            syncCounters();
        }

        JournalConfig m_config;
        Logger& m_logger;
        LineBufferedWriter m_writer;
        RetentionManager m_retention;
        Rotator m_rotator;
        AppenderState m_state;
        AppenderStats m_stats;
        bool m_failed;
    };

} // namespace rollout

#endif // ROLLOUT_APPENDER_HPP
