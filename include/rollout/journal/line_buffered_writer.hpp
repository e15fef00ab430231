#ifndef ROLLOUT_LINE_BUFFERED_WRITER_HPP
#define ROLLOUT_LINE_BUFFERED_WRITER_HPP

#include "../core/errors.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace rollout {

    /// Owns the open journal file.
    ///
    /// Tracks how many bytes the journal holds and whether the last byte
    /// written was a newline (the only place a rotation may cut). Every
    /// append is flushed before it returns.
    class LineBufferedWriter {
    public:
        LineBufferedWriter()
            : m_sizeBytes(0)
            , m_atBoundary(true) {}

        ~LineBufferedWriter() {
            if (m_file.is_open()) {
                m_file.close();
            }
        }

        LineBufferedWriter(const LineBufferedWriter&) = delete;
        LineBufferedWriter& operator=(const LineBufferedWriter&) = delete;

        /// Opens @p path for appending, creating it if missing. With
        /// @p truncate the file is emptied first. Counters restart at
        /// zero/boundary; use resume() to adopt an existing file's state.
        void open(const std::string& path, bool truncate) {
            if (m_file.is_open()) {
                m_file.close();
            }
            m_file.clear();

            std::ios::openmode mode = std::ios::out | std::ios::binary;
            mode |= truncate ? std::ios::trunc : std::ios::app;

            errno = 0;
            m_file.open(path.c_str(), mode);
            if (!m_file.is_open()) {
                throw detail::makeError(ErrorKind::Open, "cannot open journal", path, errno);
            }
            m_path = path;
            m_sizeBytes = 0;
            m_atBoundary = true;
        }

        void resume(std::uint64_t sizeBytes, bool atBoundary) {
            m_sizeBytes = sizeBytes;
            m_atBoundary = atBoundary;
        }

        void append(const char* data, std::size_t len) {
            if (len == 0) return;
            if (!m_file.is_open()) {
                throw RolloutError(ErrorKind::Write, m_path, EBADF, "journal is not open");
            }

            errno = 0;
            m_file.write(data, static_cast<std::streamsize>(len));
            m_file.flush();
            if (!m_file) {
                throw detail::makeError(ErrorKind::Write, "cannot write journal", m_path, errno);
            }

            m_sizeBytes += len;
            m_atBoundary = data[len - 1] == '\n';
        }

        void append(const std::string& chunk) {
            append(chunk.data(), chunk.size());
        }

        void flush() {
            if (!m_file.is_open()) return;
            errno = 0;
            m_file.flush();
            if (!m_file) {
                throw detail::makeError(ErrorKind::Write, "cannot flush journal", m_path, errno);
            }
        }

        void close() {
            if (!m_file.is_open()) return;
            errno = 0;
            m_file.close();
            if (m_file.fail()) {
                throw detail::makeError(ErrorKind::Write, "cannot close journal", m_path, errno);
            }
        }

        bool isOpen() const { return m_file.is_open(); }
        std::uint64_t sizeBytes() const { return m_sizeBytes; }
        bool atBoundary() const { return m_atBoundary; }
        const std::string& path() const { return m_path; }

    private:
        std::ofstream m_file;
        std::string m_path;
        std::uint64_t m_sizeBytes;
        bool m_atBoundary;
    };

} // namespace rollout

#endif // ROLLOUT_LINE_BUFFERED_WRITER_HPP
