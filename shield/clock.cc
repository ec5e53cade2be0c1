#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

#include "clock.hh"

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t
DaysFromCivil(int64_t y, unsigned m, unsigned d) noexcept
{
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tm
UtcCalendar(TimePoint tp)
{
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    std::tm cal{};
    gmtime_r(&secs, &cal);
    return cal;
}

} // namespace

int64_t
ToEpochMs(TimePoint tp) noexcept
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

TimePoint
FromEpochMs(int64_t ms) noexcept
{
    using namespace std::chrono;
    return TimePoint(duration_cast<system_clock::duration>(milliseconds(ms)));
}

std::string
DateKey(TimePoint tp)
{
    auto cal = UtcCalendar(tp);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  cal.tm_year + 1900, cal.tm_mon + 1, cal.tm_mday);
    return buf;
}

std::string
HourKey(TimePoint tp)
{
    auto cal = UtcCalendar(tp);
    char buf[20];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d",
                  cal.tm_year + 1900, cal.tm_mon + 1, cal.tm_mday,
                  cal.tm_hour);
    return buf;
}

int64_t
DayStartEpochSeconds(const std::string &dateKey)
{
    int y = 0;
    unsigned m = 0, d = 0;
    if (dateKey.size() != 10
        or std::sscanf(dateKey.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3
        or m < 1 or m > 12 or d < 1 or d > 31)
        return -1;
    return DaysFromCivil(y, m, d) * 86400;
}
