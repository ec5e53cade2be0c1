#pragma once

#include <chrono>
#include <mutex>

#include "clock.hh"

// A clock that only moves when told to. Starts at 2024-03-09T12:00:00Z.
class ManualClock : public Clock
{
    mutable std::mutex mtx;
    TimePoint now = FromEpochMs(1709985600000LL);

public:
    TimePoint Now() const override
    {
        std::lock_guard<std::mutex> lck(mtx);
        return now;
    }

    template<typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> delta)
    {
        std::lock_guard<std::mutex> lck(mtx);
        now += std::chrono::duration_cast<TimePoint::duration>(delta);
    }

    void Set(TimePoint tp)
    {
        std::lock_guard<std::mutex> lck(mtx);
        now = tp;
    }
};
