#include <govcat/core/clock.h>
#include <govcat/core/format.h>

#include <cstdio>
#include <ctime>

namespace govcat {

std::shared_ptr<IClock> systemClock() {
    static auto clock = std::make_shared<SystemClock>();
    return clock;
}

std::string toIso8601(TimePoint tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch());
    const std::time_t secs = static_cast<std::time_t>(duration_cast<seconds>(ms).count());
    int millis = static_cast<int>(ms.count() % 1000);
    if (millis < 0) {
        millis += 1000;
    }
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    return govcat::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm.tm_year + 1900,
                          tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::optional<TimePoint> parseIso8601(std::string_view text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    std::string buf(text);
    int consumed = std::sscanf(buf.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d", &year, &month, &day,
                               &hour, &minute, &second, &millis);
    if (consumed < 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    using namespace std::chrono;
    const auto ymd = year_month_day{std::chrono::year{year}, std::chrono::month{unsigned(month)},
                                    std::chrono::day{unsigned(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    TimePoint tp = sys_days{ymd};
    tp += hours{hour} + minutes{minute} + seconds{second} + milliseconds{millis};
    return tp;
}

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace govcat
