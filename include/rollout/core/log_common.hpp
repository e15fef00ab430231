#ifndef ROLLOUT_LOG_COMMON_HPP
#define ROLLOUT_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <memory>
#include <utility>

namespace rollout {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif
} // namespace detail

    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto nowTime = std::chrono::system_clock::to_time_t(time);
        auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

        std::tm tmBuf;
        localtime_r(&nowTime, &tmBuf);

        std::ostringstream oss;
        oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
        return oss.str();
    }
} // namespace rollout

#endif // ROLLOUT_LOG_COMMON_HPP
