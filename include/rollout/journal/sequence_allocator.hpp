#ifndef ROLLOUT_SEQUENCE_ALLOCATOR_HPP
#define ROLLOUT_SEQUENCE_ALLOCATOR_HPP

#include "../core/errors.hpp"
#include "../core/fs_utils.hpp"
#include "../core/journal_config.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <string>
#include <vector>

namespace rollout {

    /// A rotated log as found on disk.
    struct RotatedLog {
        unsigned int index;
        std::string name;

        RotatedLog() : index(0) {}

        bool operator<(const RotatedLog& other) const {
            return index != other.index ? index < other.index : name < other.name;
        }
    };

    /// Numbering of rotated logs, `{prefix}.{n}.log` with n >= 1.
    ///
    /// There is no persisted counter: the next index is recomputed from the
    /// directory contents each time it is needed, so a restart after a crash
    /// continues the sequence where the files say it stopped. A deleted index
    /// is never reused as long as a higher one still exists.
    class SequenceAllocator {
    public:
        static std::string rotatedName(const std::string& prefix, unsigned int index) {
            return prefix + "." + std::to_string(index) + ".log";
        }

        /// Extracts n from `{prefix}.{n}.log`. Returns false for names that
        /// do not match, or whose middle part is not a positive decimal number
        /// that fits below UINT_MAX.
        static bool parseIndex(const std::string& name, const std::string& prefix, unsigned int& index) {
            static const std::string ext = ".log";
            const std::string head = prefix + ".";

            if (name.size() <= head.size() + ext.size()) return false;
            if (name.compare(0, head.size(), head) != 0) return false;
            if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) return false;

            const char* s = name.c_str() + head.size();
            size_t n = name.size() - head.size() - ext.size();
            if (!allDigits(s, n)) return false;

            unsigned int value = parseDigits(s, n);
            if (value == 0 || value == UINT_MAX) return false;
            index = value;
            return true;
        }

        /// Rotated logs in the directory ordered by index. Zero-padded and
        /// unpadded spellings of one index are separate entries, ordered by name.
        /// @throws RolloutError (ErrorKind::Open) if the directory cannot be listed.
        static std::vector<RotatedLog> rotatedLogs(const JournalConfig& config) {
            std::vector<std::string> entries;
            if (!detail::listDirectory(config.directory(), entries)) {
                throw detail::makeError(ErrorKind::Open, "cannot list directory", config.directory(), errno);
            }

            std::vector<RotatedLog> logs;
            for (size_t i = 0; i < entries.size(); ++i) {
                RotatedLog log;
                if (parseIndex(entries[i], config.prefixName(), log.index)) {
                    log.name = entries[i];
                    logs.push_back(log);
                }
            }
            std::sort(logs.begin(), logs.end());
            return logs;
        }

        /// Indices of every rotated log in the directory, ascending.
        /// @throws RolloutError (ErrorKind::Open) if the directory cannot be listed.
        static std::vector<unsigned int> rotatedIndices(const JournalConfig& config) {
            std::vector<RotatedLog> logs = rotatedLogs(config);
            std::vector<unsigned int> indices;
            indices.reserve(logs.size());
            for (size_t i = 0; i < logs.size(); ++i) {
                indices.push_back(logs[i].index);
            }
            return indices;
        }

        /// @throws RolloutError (ErrorKind::Rename) once the highest index is
        /// UINT_MAX - 1; a further index could not be parsed back.
        static unsigned int nextIndex(const JournalConfig& config) {
            std::vector<unsigned int> indices = rotatedIndices(config);
            if (indices.empty()) return 1;
            if (indices.back() >= UINT_MAX - 1) {
                throw detail::makeError(ErrorKind::Rename, "no rotation index left after",
                                        detail::joinPath(config.directory(),
                                                         rotatedName(config.prefixName(), indices.back())),
                                        EOVERFLOW);
            }
            return indices.back() + 1;
        }

    private:
        static bool allDigits(const char* s, size_t n) {
            if (n == 0) return false;
            for (size_t i = 0; i < n; ++i) {
                if (s[i] < '0' || s[i] > '9') return false;
            }
            return true;
        }

        // Saturates at UINT_MAX on overflow.
        static unsigned int parseDigits(const char* s, size_t n) {
            unsigned int result = 0;
            for (size_t i = 0; i < n; ++i) {
                unsigned int digit = static_cast<unsigned int>(s[i] - '0');
                if (result > (UINT_MAX - digit) / 10) return UINT_MAX;
                result = result * 10 + digit;
            }
            return result;
        }
    };

} // namespace rollout

#endif // ROLLOUT_SEQUENCE_ALLOCATOR_HPP
