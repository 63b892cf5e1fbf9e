#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "sharerelay/protocol.hpp"
#include "sharerelay/server/clock.hpp"
#include "sharerelay/server/config.hpp"
#include "sharerelay/server/transfer_tracker.hpp"

namespace sharerelay::server
{

    class MessageRouter;

    // True when the sync lag or the duplicate count crosses the warning thresholds.
    bool is_degraded(const protocol::SyncStatus &status, const SupervisorConfig &config) noexcept;

    struct SupervisorCycleReport
    {
        std::size_t checked{};
        std::size_t stalled{};
        std::size_t resumed{};
        std::size_t failed{};
    };

    // Watches active transfers for stalls. Each stall issues a resume directive
    // carrying the receiver's missing chunks; once max_recovery_attempts
    // consecutive stalls pass without a new chunk, the transfer is failed.
    class SyncSupervisor
    {
    public:
        SyncSupervisor(TransferTracker &tracker, MessageRouter &router, SupervisorConfig config,
                       ClockSource clock = steady_clock_source());

        SupervisorCycleReport run_cycle();

        std::uint32_t attempts(const std::string &transfer_id) const;
        std::size_t monitored() const;

        const SupervisorConfig &config() const noexcept { return config_; }

    private:
        struct RecoveryState
        {
            std::uint32_t attempts{};
            TimePoint last_chunk_seen{};
            std::optional<TimePoint> last_attempt{};
            bool degraded{};
        };

        TransferTracker &tracker_;
        MessageRouter &router_;
        SupervisorConfig config_;
        ClockSource clock_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, RecoveryState> states_;
    };

} // namespace sharerelay::server
