#ifndef ROLLOUT_LOGGER_HPP
#define ROLLOUT_LOGGER_HPP

#include "core/log_common.hpp"
#include "core/log_entry.hpp"
#include "log_manager.hpp"
#include "sink/console_sink.hpp"
#include "formatter/human_readable_formatter.hpp"
#include <regex>
#include <sstream>
#include <string>
#include <vector>
#include <utility>
#include <type_traits>

namespace rollout {

    /// Synchronous structured logger used for the tool's own diagnostics.
    ///
    /// Messages are templates with named placeholders bound positionally:
    /// @code
    ///   logger.info("Rotated journal to {file} ({bytes} bytes)", name, size);
    /// @endcode
    /// `{{` and `}}` produce literal braces. Every entry is handed to all
    /// sinks before the call returns, so nothing is lost if the process
    /// exits right after a FATAL message.
    class Logger {
    public:
        explicit Logger(LogLevel minLevel = LogLevel::INFO, bool addDefaultConsoleSink = true)
            : m_minLevel(minLevel) {
            if (addDefaultConsoleSink) {
                addSink<ConsoleSink>();
            }
        }

        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        void setMinLevel(LogLevel level) {
            m_minLevel = level;
        }

        LogLevel getMinLevel() const {
            return m_minLevel;
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args &&... args) {
            auto sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<HumanReadableFormatter>());
            m_logManager.addSink(std::move(sink));
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value && std::is_base_of<IFormatter,
                                    FormatterType>::value>::type
        addSink(Args &&... args) {
            auto sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<FormatterType>());
            m_logManager.addSink(std::move(sink));
        }

        void addCustomSink(std::unique_ptr<ISink> sink) {
            m_logManager.addSink(std::move(sink));
        }

        template<typename... Args>
        void log(LogLevel level, const std::string &messageTemplate, const Args &... args) {
            if (level < m_minLevel) return;
            LogEntry entry = makeEntry(level, messageTemplate, args...);
            m_logManager.log(entry);
        }

        /// Entry point for the ROLLOUT_* macros.
        template<typename... Args>
        void logWithSourceLocation(LogLevel level, const char *file, int line, const char *function,
                                   const std::string &messageTemplate, const Args &... args) {
            if (level < m_minLevel) return;
            LogEntry entry = makeEntry(level, messageTemplate, args...);
            entry.file = file ? file : "";
            entry.line = line;
            entry.function = function ? function : "";
            m_logManager.log(entry);
        }

        template<typename... Args>
        void trace(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::TRACE, messageTemplate, args...);
        }

        template<typename... Args>
        void debug(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::DEBUG, messageTemplate, args...);
        }

        template<typename... Args>
        void info(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::INFO, messageTemplate, args...);
        }

        template<typename... Args>
        void warn(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::WARN, messageTemplate, args...);
        }

        template<typename... Args>
        void error(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::ERROR, messageTemplate, args...);
        }

        template<typename... Args>
        void fatal(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::FATAL, messageTemplate, args...);
        }

    private:
        LogLevel m_minLevel;
        LogManager m_logManager;

        template<typename... Args>
        static LogEntry makeEntry(LogLevel level, const std::string &messageTemplate, const Args &... args) {
            std::vector<std::string> values{toString(args)...};

            LogEntry entry;
            entry.level = level;
            entry.message = formatMessage(messageTemplate, values);
            entry.timestamp = std::chrono::system_clock::now();
            entry.templateStr = messageTemplate;
            entry.arguments = mapArgumentsToPlaceholders(messageTemplate, values);
            entry.line = 0;
            return entry;
        }

        template<typename T>
        static std::string toString(const T &value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        static std::string formatMessage(const std::string &messageTemplate, const std::vector<std::string> &values) {
            std::string result;
            result.reserve(messageTemplate.length());
            size_t valueIndex = 0;

            for (size_t i = 0; i < messageTemplate.length(); ++i) {
                if (messageTemplate[i] == '{') {
                    if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '{') {
                        result += '{';
                        ++i;
                    } else {
                        size_t endPos = messageTemplate.find('}', i);
                        if (endPos == std::string::npos) {
                            result += messageTemplate[i];
                        } else if (valueIndex < values.size()) {
                            result += values[valueIndex++];
                            i = endPos;
                        } else {
                            result += messageTemplate.substr(i, endPos - i + 1);
                            i = endPos;
                        }
                    }
                } else if (messageTemplate[i] == '}') {
                    if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '}') {
                        result += '}';
                        ++i;
                    } else {
                        result += messageTemplate[i];
                    }
                } else {
                    result += messageTemplate[i];
                }
            }
            return result;
        }

        static std::vector<std::pair<std::string, std::string> > mapArgumentsToPlaceholders(
            const std::string &messageTemplate, const std::vector<std::string> &values) {
            std::vector<std::pair<std::string, std::string> > argumentPairs;
            if (values.empty()) return argumentPairs;

            static const std::regex placeholderRegex(R"(\{([^{}]*)\})");
            auto placeholderBegin = std::sregex_iterator(messageTemplate.begin(), messageTemplate.end(),
                                                         placeholderRegex);
            auto placeholderEnd = std::sregex_iterator();

            size_t valueIndex = 0;
            for (std::sregex_iterator i = placeholderBegin; i != placeholderEnd && valueIndex < values.size(); ++i) {
                std::smatch match = *i;
                std::string placeholder = match[1].str();

                // "{{name}}" is literal text, not a placeholder.
                std::string prefix = match.prefix().str();
                if (!prefix.empty() && prefix[prefix.size() - 1] == '{') {
                    continue;
                }

                argumentPairs.emplace_back(placeholder, values[valueIndex++]);
            }

            return argumentPairs;
        }
    };
} // namespace rollout

#endif // ROLLOUT_LOGGER_HPP
