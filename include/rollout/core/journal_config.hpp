#ifndef ROLLOUT_JOURNAL_CONFIG_HPP
#define ROLLOUT_JOURNAL_CONFIG_HPP

#include "fs_utils.hpp"
#include <string>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace rollout {

    constexpr std::uint64_t kDefaultMaxSizeKb = 10240;
    constexpr unsigned int kMaxKeepCount = 999;
    constexpr std::size_t kDefaultChunkSize = 8192;

    /// Name of the active journal inside the log directory.
    constexpr const char* kJournalFileName = "current";

    /// Where and how the journal is kept. Built once at startup and never
    /// changed afterwards.
    ///
    /// @code
    ///   auto config = JournalConfig::in("/var/log/app")
    ///       .prefix("app")
    ///       .maxSizeKb(1024)
    ///       .keep(5);
    ///   config.validate();
    /// @endcode
    class JournalConfig {
    public:
        static JournalConfig in(const std::string& directory) {
            JournalConfig c;
            c.m_directory = directory;
            return c;
        }

        JournalConfig& prefix(const std::string& p) {
            m_prefix = p;
            return *this;
        }

        /// Rotation threshold in bytes.
        JournalConfig& maxSize(std::uint64_t bytes) {
            m_maxSizeBytes = bytes;
            return *this;
        }

        /// Rotation threshold in KB (1 KB = 1024 bytes).
        JournalConfig& maxSizeKb(std::uint64_t kb) {
            if (kb > std::numeric_limits<std::uint64_t>::max() / 1024) {
                throw std::invalid_argument("maximum size is too large");
            }
            m_maxSizeBytes = kb * 1024;
            return *this;
        }

        /// Number of rotated files to retain (0 = unlimited).
        JournalConfig& keep(unsigned int n) {
            m_keepCount = n;
            return *this;
        }

        JournalConfig& rotateOnStart(bool enable) {
            m_rotateOnStart = enable;
            return *this;
        }

        /// Largest read issued against the input per loop iteration.
        JournalConfig& chunkSize(std::size_t bytes) {
            m_chunkSize = bytes;
            return *this;
        }

        // --- Accessors ---
        const std::string& directory()    const { return m_directory; }
        const std::string& prefixName()   const { return m_prefix; }
        std::uint64_t      maxSizeBytes() const { return m_maxSizeBytes; }
        unsigned int       keepCount()    const { return m_keepCount; }
        bool               rotatesOnStart() const { return m_rotateOnStart; }
        std::size_t        chunkBytes()   const { return m_chunkSize; }

        std::string journalPath() const {
            return detail::joinPath(m_directory, kJournalFileName);
        }

        /// Throws std::invalid_argument describing the first violated constraint.
        void validate() const {
            if (m_directory.empty()) {
                throw std::invalid_argument("log directory not specified");
            }
            if (m_prefix.empty()) {
                throw std::invalid_argument("prefix must not be empty");
            }
            if (m_prefix.find('/') != std::string::npos) {
                throw std::invalid_argument("prefix must not contain '/'");
            }
            if (m_maxSizeBytes == 0) {
                throw std::invalid_argument("maximum size must be positive");
            }
            if (m_keepCount > kMaxKeepCount) {
                throw std::invalid_argument("keep must be between 0 and 999");
            }
            if (m_chunkSize == 0) {
                throw std::invalid_argument("chunk size must be positive");
            }
        }

    private:
        JournalConfig()
            : m_maxSizeBytes(kDefaultMaxSizeKb * 1024)
            , m_keepCount(0)
            , m_rotateOnStart(false)
            , m_chunkSize(kDefaultChunkSize) {}

        std::string   m_directory;
        std::string   m_prefix;
        std::uint64_t m_maxSizeBytes;
        unsigned int  m_keepCount;
        bool          m_rotateOnStart;
        std::size_t   m_chunkSize;
    };

} // namespace rollout

#endif // ROLLOUT_JOURNAL_CONFIG_HPP
