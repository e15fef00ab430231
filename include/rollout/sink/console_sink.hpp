#ifndef ROLLOUT_CONSOLE_SINK_HPP
#define ROLLOUT_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/stderr_transport.hpp"

namespace rollout {
    /// Writes formatted entries to stderr.
    class ConsoleSink : public ISink {
    public:
        ConsoleSink() {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<StderrTransport>());
        }

        void write(const LogEntry &entry) override {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(entry));
            }
        }
    };
} // namespace rollout

#endif // ROLLOUT_CONSOLE_SINK_HPP
