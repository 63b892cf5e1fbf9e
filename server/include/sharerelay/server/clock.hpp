#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sharerelay::server
{

    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = SteadyClock::time_point;

    // Injected into the registry, tracker and supervisor so tests can drive time.
    using ClockSource = std::function<TimePoint()>;

    ClockSource steady_clock_source();

    // Maps a steady time point onto Unix milliseconds relative to the current wall clock.
    std::int64_t to_unix_millis(TimePoint point, TimePoint steady_now);

    std::int64_t unix_millis_now();

} // namespace sharerelay::server
