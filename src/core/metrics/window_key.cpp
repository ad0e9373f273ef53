#include <healthstream/core/metrics/window_key.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace HealthStream {

namespace {

std::tm toUtc(std::time_t t) {
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

std::string formatKey(const std::tm& tm) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

int parseDigits(const std::string& s, size_t pos, size_t len) {
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

} // namespace

std::string WindowKey::fromTime(SystemClock::time_point tp, std::chrono::seconds window) {
    if (window.count() <= 0) {
        window = DEFAULT_WINDOW;
    }

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    auto width = window.count();
    // floor division so pre-epoch times still land on a boundary
    auto truncated = secs - ((secs % width) + width) % width;

    std::tm tm = toUtc(static_cast<std::time_t>(truncated));
    if (width >= 3600) {
        tm.tm_min = 0;
        tm.tm_sec = 0;
    } else if (width >= 60) {
        tm.tm_sec = 0;
    }
    return formatKey(tm);
}

std::string WindowKey::fromTimeExact(SystemClock::time_point tp) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return formatKey(toUtc(static_cast<std::time_t>(secs)));
}

std::optional<SystemClock::time_point> WindowKey::toTime(const std::string& key) {
    if (key.size() != KEY_LENGTH) {
        return std::nullopt;
    }
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    tm.tm_year = parseDigits(key, 0, 4) - 1900;
    tm.tm_mon = parseDigits(key, 4, 2) - 1;
    tm.tm_mday = parseDigits(key, 6, 2);
    tm.tm_hour = parseDigits(key, 8, 2);
    tm.tm_min = parseDigits(key, 10, 2);
    tm.tm_sec = parseDigits(key, 12, 2);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tm);
    // timegm normalises 20240231 into March; reject anything that moved
    if (formatKey(toUtc(t)) != key) {
        return std::nullopt;
    }
    return SystemClock::from_time_t(t);
}

std::string WindowKey::dateStamp(SystemClock::time_point tp) {
    std::tm tm = toUtc(SystemClock::to_time_t(tp));
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return std::string(buf);
}

} // namespace HealthStream
