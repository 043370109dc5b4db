#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <govcat/core/types.h>

namespace govcat {

// Wall clock seam so rate windows and timestamps are testable
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public IClock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

std::shared_ptr<IClock> systemClock();

// UTC ISO-8601 with milliseconds, e.g. 2025-08-27T10:15:30.123Z
std::string toIso8601(TimePoint tp);
std::optional<TimePoint> parseIso8601(std::string_view text);

int64_t toEpochMillis(TimePoint tp);

} // namespace govcat
