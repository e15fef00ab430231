#ifndef ROLLOUT_MACROS_HPP
#define ROLLOUT_MACROS_HPP

#ifndef ROLLOUT_NO_MACROS

// Generic macro --- level check avoids argument evaluation when disabled
#define ROLLOUT_LOG(logger, level, ...) \
    do { \
        auto& rollout_log_ref_ = (logger); \
        auto  rollout_log_lvl_ = (level); \
        if (rollout_log_lvl_ >= rollout_log_ref_.getMinLevel()) { \
            rollout_log_ref_.logWithSourceLocation( \
                rollout_log_lvl_, __FILE__, __LINE__, \
                __func__, \
                __VA_ARGS__); \
        } \
    } while (0)

#define ROLLOUT_TRACE(logger, ...) ROLLOUT_LOG((logger), ::rollout::LogLevel::TRACE, __VA_ARGS__)
#define ROLLOUT_DEBUG(logger, ...) ROLLOUT_LOG((logger), ::rollout::LogLevel::DEBUG, __VA_ARGS__)
#define ROLLOUT_INFO(logger, ...)  ROLLOUT_LOG((logger), ::rollout::LogLevel::INFO,  __VA_ARGS__)
#define ROLLOUT_WARN(logger, ...)  ROLLOUT_LOG((logger), ::rollout::LogLevel::WARN,  __VA_ARGS__)
#define ROLLOUT_ERROR(logger, ...) ROLLOUT_LOG((logger), ::rollout::LogLevel::ERROR, __VA_ARGS__)
#define ROLLOUT_FATAL(logger, ...) ROLLOUT_LOG((logger), ::rollout::LogLevel::FATAL, __VA_ARGS__)

#endif // ROLLOUT_NO_MACROS

#endif // ROLLOUT_MACROS_HPP
