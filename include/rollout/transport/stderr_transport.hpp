#ifndef ROLLOUT_STDERR_TRANSPORT_HPP
#define ROLLOUT_STDERR_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>

namespace rollout {
    /// Diagnostics channel; one flushed line per entry.
    class StderrTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::cerr << formattedEntry << '\n' << std::flush;
        }
    };
} // namespace rollout

#endif // ROLLOUT_STDERR_TRANSPORT_HPP
