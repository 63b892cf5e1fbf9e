#include "sharerelay/server/sync_supervisor.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sharerelay/server/message_router.hpp"

namespace sharerelay::server
{

    bool is_degraded(const protocol::SyncStatus &status, const SupervisorConfig &config) noexcept
    {
        return status.sync_lag > config.lag_warning_threshold ||
               status.duplicates_rejected > config.duplicate_warning_threshold;
    }

    SyncSupervisor::SyncSupervisor(TransferTracker &tracker, MessageRouter &router, SupervisorConfig config,
                                   ClockSource clock)
        : tracker_(tracker), router_(router), config_(config), clock_(std::move(clock)) {}

    SupervisorCycleReport SyncSupervisor::run_cycle()
    {
        struct ResumeAction
        {
            Transfer transfer;
            std::vector<std::uint32_t> missing;
            std::uint32_t attempt{};
        };

        SupervisorCycleReport report{};
        std::vector<std::string> status_changed;
        std::vector<ResumeAction> resumes;
        std::vector<std::string> exhausted;

        const auto now = clock_();
        const auto active = tracker_.active_transfers();
        report.checked = active.size();

        {
            std::lock_guard lock(mutex_);

            std::unordered_set<std::string> live;
            for (const auto &transfer : active)
            {
                live.insert(transfer.transfer_id);
            }
            std::erase_if(states_, [&](const auto &item)
                          { return !live.contains(item.first); });

            for (const auto &transfer : active)
            {
                auto [it, inserted] = states_.try_emplace(transfer.transfer_id);
                auto &state = it->second;
                if (inserted || transfer.last_chunk_time != state.last_chunk_seen)
                {
                    state.attempts = 0;
                    state.last_attempt.reset();
                    state.last_chunk_seen = transfer.last_chunk_time;
                }

                const auto degraded = is_degraded(TransferTracker::make_sync_status(transfer, now), config_);
                if (degraded != state.degraded)
                {
                    state.degraded = degraded;
                    if (degraded)
                    {
                        spdlog::warn("Transfer {} is degraded (sent {:.1f}%, received {:.1f}%, {} duplicates)",
                                     transfer.transfer_id, transfer.sent_progress, transfer.received_progress,
                                     transfer.duplicate_chunks);
                    }
                    status_changed.push_back(transfer.transfer_id);
                }

                // The stall window restarts after each resume directive.
                const auto reference = std::max(transfer.last_chunk_time, state.last_attempt.value_or(TimePoint{}));
                if (now - reference <= config_.stall_timeout)
                {
                    continue;
                }

                ++report.stalled;
                ++state.attempts;
                state.last_attempt = now;
                if (state.attempts >= config_.max_recovery_attempts)
                {
                    exhausted.push_back(transfer.transfer_id);
                    continue;
                }

                spdlog::info("Transfer {} stalled, recovery attempt {}/{}", transfer.transfer_id, state.attempts,
                             config_.max_recovery_attempts);
                auto missing = tracker_.compute_missing_chunks(transfer.transfer_id);
                if (!missing.empty())
                {
                    resumes.push_back(ResumeAction{
                        .transfer = transfer,
                        .missing = std::move(missing),
                        .attempt = state.attempts,
                    });
                }
            }

            for (const auto &transfer_id : exhausted)
            {
                states_.erase(transfer_id);
            }
        }

        for (const auto &transfer_id : status_changed)
        {
            router_.broadcast_sync_status(transfer_id);
        }
        for (const auto &action : resumes)
        {
            if (router_.send_resume_directive(action.transfer, action.missing, action.attempt))
            {
                ++report.resumed;
            }
        }
        for (const auto &transfer_id : exhausted)
        {
            if (router_.fail_transfer(transfer_id, kReasonRecoveryExhausted, ErrorCode::RecoveryExhausted))
            {
                ++report.failed;
            }
        }
        return report;
    }

    std::uint32_t SyncSupervisor::attempts(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = states_.find(transfer_id);
        return it == states_.end() ? 0 : it->second.attempts;
    }

    std::size_t SyncSupervisor::monitored() const
    {
        std::lock_guard lock(mutex_);
        return states_.size();
    }

} // namespace sharerelay::server
