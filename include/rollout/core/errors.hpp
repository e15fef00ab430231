#ifndef ROLLOUT_ERRORS_HPP
#define ROLLOUT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstring>

namespace rollout {

    /// What the engine was doing when an I/O operation failed.
    ///
    /// Open, Read, Write and Rename end the process: the journal can no
    /// longer be trusted to hold every byte of the input. Delete only
    /// affects retention of already rotated files and is reported but
    /// never thrown out of the engine.
    enum class ErrorKind {
        Open,
        Read,
        Write,
        Rename,
        Delete
    };

    inline const char* getErrorKindString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Open: return "Open";
            case ErrorKind::Read: return "Read";
            case ErrorKind::Write: return "Write";
            case ErrorKind::Rename: return "Rename";
            case ErrorKind::Delete: return "Delete";
            default: return "Unknown";
        }
    }

    class RolloutError : public std::runtime_error {
    public:
        RolloutError(ErrorKind kind, const std::string& path, int errorCode, const std::string& message)
            : std::runtime_error(message)
            , m_kind(kind)
            , m_path(path)
            , m_errorCode(errorCode) {}

        ErrorKind kind() const { return m_kind; }

        /// File or directory the failed operation targeted ("stdin" for reads).
        const std::string& path() const { return m_path; }

        /// errno captured at the point of failure, 0 if the OS gave none.
        int errorCode() const { return m_errorCode; }

        bool isFatal() const { return m_kind != ErrorKind::Delete; }

    private:
        ErrorKind m_kind;
        std::string m_path;
        int m_errorCode;
    };

namespace detail {

    inline std::string describeErrno(int errorCode) {
        if (errorCode == 0) return "I/O error";
        return std::strerror(errorCode);
    }

    /// Builds "<action> '<path>': <reason>".
    inline RolloutError makeError(ErrorKind kind, const std::string& action,
                                  const std::string& path, int errorCode) {
        return RolloutError(kind, path, errorCode,
                            action + " '" + path + "': " + describeErrno(errorCode));
    }

} // namespace detail

} // namespace rollout

#endif // ROLLOUT_ERRORS_HPP
