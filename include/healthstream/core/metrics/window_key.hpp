#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace HealthStream {

using SystemClock = std::chrono::system_clock;
using TimeSource = std::function<SystemClock::time_point()>;

/**
 * @brief Canonical time-window keys
 *
 * A key is the UTC wall-clock time truncated to an epoch-aligned window and
 * printed as fixed-width YYYYMMDDHHMMSS, so string order equals time order.
 * Digits below the window granularity are zeroed (>= 1h: mm and ss, >= 1m: ss).
 */
class WindowKey {
public:
    static constexpr std::chrono::seconds DEFAULT_WINDOW{60};
    static constexpr std::size_t KEY_LENGTH = 14;

    static std::string fromTime(SystemClock::time_point tp, std::chrono::seconds window);

    // One-second precision, used for query range bounds
    static std::string fromTimeExact(SystemClock::time_point tp);

    static std::optional<SystemClock::time_point> toTime(const std::string& key);

    static bool isValid(const std::string& key) { return toTime(key).has_value(); }

    // Calendar date YYYYMMDD (UTC), shared with backup artifact naming
    static std::string dateStamp(SystemClock::time_point tp);

    static SystemClock::time_point systemNow() { return SystemClock::now(); }
};

} // namespace HealthStream
