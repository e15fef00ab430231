#ifndef ROLLOUT_RUN_HPP
#define ROLLOUT_RUN_HPP

#include "options.hpp"
#include "../appender.hpp"
#include "../core/errors.hpp"
#include "../io/input_reader.hpp"
#include "../logger.hpp"
#include <exception>
#include <stdexcept>

namespace rollout {

    /// Runs the appender over @p input with the configuration from @p options.
    /// Every failure is logged at FATAL on @p logger.
    /// @return the process exit status: 0 at end of input, 1 otherwise.
    inline int runAppender(const Options& options, IInputReader& input, Logger& logger) {
        try {
            Appender appender(options.toConfig(), logger);
            AppenderStats stats = appender.run(input);
            logger.debug("Wrote {bytes} bytes, {rotations} rotations, {failures} retention failures",
                         stats.bytesWritten, stats.rotations, stats.retentionFailures);
            return 0;
        } catch (const RolloutError& e) {
            logger.fatal("{kind} error: {reason}", getErrorKindString(e.kind()), e.what());
        } catch (const std::invalid_argument& e) {
            logger.fatal("Invalid configuration: {reason}", e.what());
        } catch (const std::exception& e) {
            logger.fatal("Unexpected error: {reason}", e.what());
        }
        return 1;
    }

} // namespace rollout

#endif // ROLLOUT_RUN_HPP
