#ifndef ROLLOUT_CALLBACK_SINK_HPP
#define ROLLOUT_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include <functional>
#include <string>
#include <memory>

namespace rollout {

    /// Sink that invokes a user-provided callback for each log entry.
    ///
    /// Two variants:
    ///   1. EntryCallback receives the raw LogEntry.
    ///   2. StringCallback receives the formatted string
    ///      (HumanReadableFormatter unless another formatter is given).
    ///
    /// In C++11, wrap lambdas in the typedef to avoid overload ambiguity:
    /// @code
    ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
    /// @endcode
    ///
    /// @note Exceptions thrown by the callback propagate to the logging call.
    class CallbackSink : public ISink {
    public:
        using EntryCallback  = std::function<void(const LogEntry&)>;
        using StringCallback = std::function<void(const std::string&)>;

        explicit CallbackSink(EntryCallback cb)
            : m_entryCallback(std::move(cb))
            , m_mode(Mode::Entry) {}

        explicit CallbackSink(StringCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::String) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(detail::make_unique<HumanReadableFormatter>());
            }
        }

        void write(const LogEntry& entry) override {
            if (m_mode == Mode::Entry) {
                if (m_entryCallback) {
                    m_entryCallback(entry);
                }
            } else {
                IFormatter* fmt = formatter();
                if (m_stringCallback && fmt) {
                    m_stringCallback(fmt->format(entry));
                }
            }
        }

    private:
        enum class Mode { Entry, String };

        EntryCallback  m_entryCallback;
        StringCallback m_stringCallback;
        Mode           m_mode;
    };

} // namespace rollout

#endif // ROLLOUT_CALLBACK_SINK_HPP
