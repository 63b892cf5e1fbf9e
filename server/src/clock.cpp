#include "sharerelay/server/clock.hpp"

namespace sharerelay::server
{

    ClockSource steady_clock_source()
    {
        return []
        { return SteadyClock::now(); };
    }

    std::int64_t to_unix_millis(TimePoint point, TimePoint steady_now)
    {
        using namespace std::chrono;
        const auto wall = system_clock::now() - duration_cast<system_clock::duration>(steady_now - point);
        return duration_cast<milliseconds>(wall.time_since_epoch()).count();
    }

    std::int64_t unix_millis_now()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

} // namespace sharerelay::server
