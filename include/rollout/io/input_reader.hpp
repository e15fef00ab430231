#ifndef ROLLOUT_INPUT_READER_HPP
#define ROLLOUT_INPUT_READER_HPP

#include "../core/errors.hpp"
#include <cstddef>
#include <cerrno>
#include <istream>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace rollout {

    /// Source of journal bytes.
    class IInputReader {
    public:
        virtual ~IInputReader() = default;

        /// Blocks until at least one byte, end of stream, or an error.
        /// @return bytes stored in @p buffer, 0 at end of stream.
        /// @throws RolloutError (ErrorKind::Read) when the source fails.
        virtual std::size_t read(char* buffer, std::size_t capacity) = 0;
    };

    /// Reads a raw file descriptor, normally STDIN_FILENO.
    class FdInputReader : public IInputReader {
    public:
        explicit FdInputReader(int fd, const std::string& name = "stdin")
            : m_fd(fd), m_name(name) {}

        std::size_t read(char* buffer, std::size_t capacity) override {
            for (;;) {
                ssize_t n = ::read(m_fd, buffer, capacity);
                if (n >= 0) {
                    return static_cast<std::size_t>(n);
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    waitReadable();
                    continue;
                }
                throw detail::makeError(ErrorKind::Read, "cannot read from", m_name, errno);
            }
        }

    private:
        // A non-blocking descriptor inherited from the parent must not turn
        // the read loop into a busy spin.
        void waitReadable() {
            struct pollfd pfd;
            pfd.fd = m_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            while (::poll(&pfd, 1, -1) < 0) {
                if (errno != EINTR) {
                    throw detail::makeError(ErrorKind::Read, "cannot wait for", m_name, errno);
                }
            }
        }

        int m_fd;
        std::string m_name;
    };

    /// Adapts a std::istream; used when embedding the appender and in tests.
    class StreamInputReader : public IInputReader {
    public:
        explicit StreamInputReader(std::istream& in, const std::string& name = "stream")
            : m_in(in), m_name(name) {}

        std::size_t read(char* buffer, std::size_t capacity) override {
            if (m_in.eof()) return 0;
            m_in.read(buffer, static_cast<std::streamsize>(capacity));
            if (m_in.bad()) {
                throw detail::makeError(ErrorKind::Read, "cannot read from", m_name, 0);
            }
            return static_cast<std::size_t>(m_in.gcount());
        }

    private:
        std::istream& m_in;
        std::string m_name;
    };

} // namespace rollout

#endif // ROLLOUT_INPUT_READER_HPP
