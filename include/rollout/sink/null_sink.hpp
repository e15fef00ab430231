#ifndef ROLLOUT_NULL_SINK_HPP
#define ROLLOUT_NULL_SINK_HPP

#include "sink_interface.hpp"

namespace rollout {

    /// Discards every entry.
    class NullSink : public ISink {
    public:
        void write(const LogEntry&) override {}
    };

} // namespace rollout

#endif // ROLLOUT_NULL_SINK_HPP
