#ifndef ROLLOUT_OPTIONS_HPP
#define ROLLOUT_OPTIONS_HPP

#include "../core/fs_utils.hpp"
#include "../core/journal_config.hpp"
#include "../core/log_level.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace rollout {

    /// Bad command line. what() is the message shown before the help text.
    class UsageError : public std::runtime_error {
    public:
        explicit UsageError(const std::string& message) : std::runtime_error(message) {}
    };

    enum class LogFormat {
        Text,
        Json
    };

    struct Options {
        bool showHelp;
        std::string directory;
        std::string prefix;
        std::uint64_t sizeKb;
        unsigned int keep;
        bool rotateOnStart;
        LogLevel logLevel;
        LogFormat logFormat;

        Options()
            : showHelp(false)
            , sizeKb(kDefaultMaxSizeKb)
            , keep(0)
            , rotateOnStart(false)
            , logLevel(LogLevel::INFO)
            , logFormat(LogFormat::Text) {}

        JournalConfig toConfig() const {
            return JournalConfig::in(directory)
                .prefix(prefix)
                .maxSizeKb(sizeKb)
                .keep(keep)
                .rotateOnStart(rotateOnStart);
        }
    };

    inline const char* usage() {
        return
            "A rolling logfile appender\n"
            "\n"
            "Reads stdin and appends it to log files in <dir>. Files are broken at a\n"
            "newline as close as possible to the specified size. The active file is\n"
            "<dir>/current; rotated files are named {prefix}.{n}.log, n starting at 1.\n"
            "Any unrecoverable error exits immediately with status 1.\n"
            "\n"
            "USAGE:\n"
            "  rollout [OPTIONS] --prefix <prefix> <dir>\n"
            "\n"
            "FLAGS:\n"
            "  -h, --help                Prints help information\n"
            "  -r, --rotate-on-start     Rotate a leftover current file on startup\n"
            "\n"
            "OPTIONS:\n"
            "  -s, --size <KB>           Max log size in KB (default 10240)\n"
            "  -k, --keep <N>            Max rotated files to keep, 0 = unlimited (default 0, max 999)\n"
            "  -p, --prefix <prefix>     Log file prefix (required)\n"
            "      --log-level <level>   Diagnostics level: trace, debug, info, warn, error, fatal (default info)\n"
            "      --log-format <fmt>    Diagnostics format: text or json (default text)\n"
            "\n"
            "ARGS:\n"
            "  <dir>                     Log directory, created if missing\n";
    }

namespace detail {

    inline bool parseUnsigned(const std::string& text, std::uint64_t& out) {
        if (text.empty()) return false;
        std::uint64_t value = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c < '0' || c > '9') return false;
            std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return false;
            value = value * 10 + digit;
        }
        out = value;
        return true;
    }

    inline std::uint64_t expectNumber(const std::string& text) {
        std::uint64_t value = 0;
        if (!parseUnsigned(text, value)) {
            throw UsageError("Expected number, found '" + text + "'");
        }
        return value;
    }

} // namespace detail

    /// Parses the arguments that follow the program name.
    /// @throws UsageError
    inline Options parseArgs(const std::vector<std::string>& args) {
        enum class Pending { None, Size, Keep, Prefix, LogLevel, LogFormat };

        Options options;
        Pending pending = Pending::None;
        bool haveDirectory = false;
        bool havePrefix = false;

        for (size_t i = 0; i < args.size(); ++i) {
            std::string arg = args[i];

            if (pending == Pending::None && arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    // --name=value is handled as "--name" "value"
                    std::string name = arg.substr(0, eq);
                    if (name == "--size") pending = Pending::Size;
                    else if (name == "--keep") pending = Pending::Keep;
                    else if (name == "--prefix") pending = Pending::Prefix;
                    else if (name == "--log-level") pending = Pending::LogLevel;
                    else if (name == "--log-format") pending = Pending::LogFormat;
                    else throw UsageError("Unknown argument '" + arg + "'");
                    arg = arg.substr(eq + 1);
                }
            }

            switch (pending) {
                case Pending::Size: {
                    std::uint64_t kb = detail::expectNumber(arg);
                    if (kb == 0) {
                        throw UsageError("Size must be a positive number of KB");
                    }
                    if (kb > std::numeric_limits<std::uint64_t>::max() / 1024) {
                        throw UsageError("Size is too large");
                    }
                    options.sizeKb = kb;
                    pending = Pending::None;
                    continue;
                }
                case Pending::Keep: {
                    std::uint64_t keep = detail::expectNumber(arg);
                    if (keep > kMaxKeepCount) {
                        throw UsageError("Keep must be between 0 and 999");
                    }
                    options.keep = static_cast<unsigned int>(keep);
                    pending = Pending::None;
                    continue;
                }
                case Pending::Prefix:
                    options.prefix = arg;
                    havePrefix = true;
                    pending = Pending::None;
                    continue;
                case Pending::LogLevel:
                    if (!parseLevel(arg, options.logLevel)) {
                        throw UsageError("Unknown log level '" + arg + "'");
                    }
                    pending = Pending::None;
                    continue;
                case Pending::LogFormat:
                    if (arg == "text") options.logFormat = LogFormat::Text;
                    else if (arg == "json") options.logFormat = LogFormat::Json;
                    else throw UsageError("Unknown log format '" + arg + "'");
                    pending = Pending::None;
                    continue;
                case Pending::None:
                    break;
            }

            if (arg == "-h" || arg == "--help") {
                options.showHelp = true;
                return options;
            } else if (arg == "-s" || arg == "--size") {
                pending = Pending::Size;
            } else if (arg == "-k" || arg == "--keep") {
                pending = Pending::Keep;
            } else if (arg == "-p" || arg == "--prefix") {
                pending = Pending::Prefix;
            } else if (arg == "--log-level") {
                pending = Pending::LogLevel;
            } else if (arg == "--log-format") {
                pending = Pending::LogFormat;
            } else if (arg == "-r" || arg == "--rotate-on-start") {
                options.rotateOnStart = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw UsageError("Unknown argument '" + arg + "'");
            } else if (haveDirectory) {
                throw UsageError("Unexpected argument '" + arg + "'");
            } else {
                options.directory = arg;
                haveDirectory = true;
            }
        }

        if (pending != Pending::None) {
            throw UsageError(pending == Pending::Size || pending == Pending::Keep
                                 ? "Expected number"
                                 : "Expected value after '" + args.back() + "'");
        }
        if (!haveDirectory || options.directory.empty()) {
            throw UsageError("Log directory not specified");
        }
        if (!havePrefix) {
            throw UsageError("Missing prefix");
        }
        if (options.prefix.empty() || options.prefix.find('/') != std::string::npos) {
            throw UsageError("Invalid prefix '" + options.prefix + "'");
        }
        return options;
    }

    inline Options parseArgs(int argc, const char* const* argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parseArgs(args);
    }

    /// Creates the log directory (and parents) if needed.
    /// @throws UsageError if it cannot be found or created.
    inline void ensureDirectory(const std::string& directory) {
        if (!detail::mkdirRecursive(directory)) {
            throw UsageError("Unable to find or create directory '" + directory + "'");
        }
    }

} // namespace rollout

#endif // ROLLOUT_OPTIONS_HPP
