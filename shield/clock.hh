#pragma once

#include <chrono>
#include <cstdint>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Source of wall-clock time.
 *
 * Every component that measures ages or windows takes a Clock so that time can
 * be driven by hand in tests. Wall-clock time is used on purpose, since
 * timestamps are shared with other processes through the remote store.
 */
class Clock
{
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

// The production clock.
class SystemClock : public Clock
{
public:
    TimePoint Now() const override
    {
        return std::chrono::system_clock::now();
    }
};

int64_t
ToEpochMs(TimePoint tp) noexcept;

TimePoint
FromEpochMs(int64_t ms) noexcept;

// UTC calendar day, e.g. 2024-03-09.
std::string
DateKey(TimePoint tp);

// UTC calendar hour, e.g. 2024-03-09T17.
std::string
HourKey(TimePoint tp);

// Start of the UTC day named by a date key, in epoch seconds. Returns -1 if
// the key is malformed.
int64_t
DayStartEpochSeconds(const std::string &dateKey);
