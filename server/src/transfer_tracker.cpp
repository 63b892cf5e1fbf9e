#include "sharerelay/server/transfer_tracker.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace sharerelay::server
{

    namespace
    {

        struct StatusMapping
        {
            TransferStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {TransferStatus::Pending, "pending"},
            {TransferStatus::Active, "active"},
            {TransferStatus::Completed, "completed"},
            {TransferStatus::Failed, "failed"},
        }};

        double progress_for(std::int64_t high_water, std::uint32_t total_chunks)
        {
            if (total_chunks == 0 || high_water < 0)
            {
                return 0.0;
            }
            const auto progress = (static_cast<double>(high_water) + 1.0) / static_cast<double>(total_chunks) * 100.0;
            return std::min(progress, 100.0);
        }

    } // namespace

    std::string_view to_string(TransferStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    DuplicateTransferError::DuplicateTransferError(const std::string &transfer_id)
        : std::runtime_error("Transfer already exists: " + transfer_id), transfer_id_(transfer_id) {}

    TransferTracker::TransferTracker(ClockSource clock)
        : clock_(std::move(clock)) {}

    std::string TransferTracker::make_transfer_id(std::string_view sender_id, std::string_view receiver_id,
                                                  std::string_view file_id)
    {
        std::string id;
        id.reserve(sender_id.size() + receiver_id.size() + file_id.size() + 2);
        id.append(sender_id).append("-").append(receiver_id).append("-").append(file_id);
        return id;
    }

    Transfer TransferTracker::create_transfer(const std::string &sender_id, const std::string &receiver_id,
                                              const std::string &file_id, const protocol::FileInfo &file_info)
    {
        auto transfer_id = make_transfer_id(sender_id, receiver_id, file_id);

        std::lock_guard lock(mutex_);
        if (transfers_.contains(transfer_id))
        {
            throw DuplicateTransferError(transfer_id);
        }

        const auto now = clock_();
        Transfer transfer{};
        transfer.transfer_id = transfer_id;
        transfer.sender_id = sender_id;
        transfer.receiver_id = receiver_id;
        transfer.file_id = file_id;
        transfer.file_info = file_info;
        transfer.status = TransferStatus::Pending;
        transfer.acknowledged.assign(file_info.total_chunks, false);
        transfer.created_at = now;
        transfer.last_chunk_time = now;

        return transfers_.emplace(std::move(transfer_id), std::move(transfer)).first->second;
    }

    std::optional<Transfer> TransferTracker::activate(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || it->second.status != TransferStatus::Pending)
        {
            return std::nullopt;
        }
        it->second.status = TransferStatus::Active;
        it->second.last_chunk_time = clock_();
        return it->second;
    }

    std::optional<Transfer> TransferTracker::remove(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            return std::nullopt;
        }
        auto transfer = std::move(it->second);
        transfers_.erase(it);
        return transfer;
    }

    std::optional<Transfer> TransferTracker::record_chunk_sent(const std::string &transfer_id,
                                                               std::uint32_t chunk_index, std::uint32_t total_chunks)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            spdlog::warn("Chunk {} sent for unknown transfer {}", chunk_index, transfer_id);
            return std::nullopt;
        }
        auto &transfer = it->second;
        const auto total = total_chunks == 0 ? transfer.file_info.total_chunks : total_chunks;
        transfer.sent_high_water = std::max<std::int64_t>(transfer.sent_high_water, chunk_index);
        transfer.sent_progress = std::max(transfer.sent_progress, progress_for(transfer.sent_high_water, total));
        transfer.last_chunk_time = clock_();
        return transfer;
    }

    std::optional<AckResult> TransferTracker::record_chunk_ack(const std::string &transfer_id,
                                                               std::uint32_t chunk_index, std::uint32_t total_chunks,
                                                               bool is_duplicate)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            spdlog::warn("Ack for chunk {} on unknown transfer {}", chunk_index, transfer_id);
            return std::nullopt;
        }
        auto &transfer = it->second;
        if (chunk_index >= transfer.acknowledged.size())
        {
            spdlog::warn("Ack for chunk {} outside transfer {} ({} chunks)", chunk_index, transfer_id,
                         transfer.acknowledged.size());
            return std::nullopt;
        }

        // A second "received" ack for the same index is a duplicate as well.
        const bool duplicate = is_duplicate || transfer.acknowledged[chunk_index];
        if (duplicate)
        {
            ++transfer.duplicate_chunks;
            return AckResult{.transfer = transfer, .duplicate = true};
        }

        const auto total = total_chunks == 0 ? transfer.file_info.total_chunks : total_chunks;
        transfer.acknowledged[chunk_index] = true;
        ++transfer.acknowledged_count;
        if (static_cast<std::int64_t>(chunk_index) < transfer.received_high_water)
        {
            spdlog::debug("Late ack for chunk {} below high-water mark {} on {}", chunk_index,
                          transfer.received_high_water, transfer_id);
        }
        transfer.received_high_water = std::max<std::int64_t>(transfer.received_high_water, chunk_index);
        transfer.received_progress =
            std::max(transfer.received_progress, progress_for(transfer.received_high_water, total));
        transfer.last_chunk_time = clock_();
        return AckResult{.transfer = transfer, .duplicate = false};
    }

    bool TransferTracker::mark_complete(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            spdlog::warn("Completion for unknown transfer {}", transfer_id);
            return false;
        }
        auto &transfer = it->second;
        if (transfer.status != TransferStatus::Active)
        {
            spdlog::debug("Ignoring completion of transfer {} in state {}", transfer_id, to_string(transfer.status));
            return false;
        }
        transfer.status = TransferStatus::Completed;
        transfer.completed_at = clock_();
        return true;
    }

    std::optional<Transfer> TransferTracker::mark_failed(const std::string &transfer_id, const std::string &reason)
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || is_terminal(it->second.status))
        {
            return std::nullopt;
        }
        auto transfer = std::move(it->second);
        transfers_.erase(it);
        transfer.status = TransferStatus::Failed;
        transfer.failure_reason = reason;
        return transfer;
    }

    std::vector<Transfer> TransferTracker::fail_transfers_for_device(const std::string &device_id,
                                                                     const std::string &reason)
    {
        std::vector<Transfer> failed;
        std::lock_guard lock(mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();)
        {
            const auto &transfer = it->second;
            const bool involved = transfer.sender_id == device_id || transfer.receiver_id == device_id;
            if (involved && !is_terminal(transfer.status))
            {
                auto snapshot = std::move(it->second);
                snapshot.status = TransferStatus::Failed;
                snapshot.failure_reason = reason;
                failed.push_back(std::move(snapshot));
                it = transfers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return failed;
    }

    std::vector<std::uint32_t> TransferTracker::compute_missing_chunks(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::uint32_t> missing;
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            return missing;
        }
        const auto &acknowledged = it->second.acknowledged;
        for (std::size_t index = 0; index < acknowledged.size(); ++index)
        {
            if (!acknowledged[index])
            {
                missing.push_back(static_cast<std::uint32_t>(index));
            }
        }
        return missing;
    }

    std::optional<Transfer> TransferTracker::find(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it != transfers_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<Transfer> TransferTracker::find_by_sender(const std::string &sender_id,
                                                            const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(transfers_.begin(), transfers_.end(), [&](const auto &item)
                               {
            const auto &transfer = item.second;
            return transfer.sender_id == sender_id && transfer.file_id == file_id; });
        if (it != transfers_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<protocol::SyncStatus> TransferTracker::sync_status(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end())
        {
            return std::nullopt;
        }
        return make_sync_status(it->second, clock_());
    }

    std::vector<Transfer> TransferTracker::active_transfers() const
    {
        std::lock_guard lock(mutex_);
        std::vector<Transfer> active;
        for (const auto &[id, transfer] : transfers_)
        {
            if (transfer.status == TransferStatus::Active)
            {
                active.push_back(transfer);
            }
        }
        return active;
    }

    std::size_t TransferTracker::size() const
    {
        std::lock_guard lock(mutex_);
        return transfers_.size();
    }

    std::size_t TransferTracker::purge_completed(std::chrono::milliseconds grace)
    {
        std::lock_guard lock(mutex_);
        const auto now = clock_();
        std::size_t purged = 0;
        for (auto it = transfers_.begin(); it != transfers_.end();)
        {
            const auto &transfer = it->second;
            if (transfer.status == TransferStatus::Completed && transfer.completed_at &&
                now - *transfer.completed_at >= grace)
            {
                spdlog::debug("Purging completed transfer {}", it->first);
                it = transfers_.erase(it);
                ++purged;
            }
            else
            {
                ++it;
            }
        }
        return purged;
    }

    protocol::SyncStatus TransferTracker::make_sync_status(const Transfer &transfer, TimePoint now)
    {
        return protocol::SyncStatus{
            .transfer_id = transfer.transfer_id,
            .sender_id = transfer.sender_id,
            .receiver_id = transfer.receiver_id,
            .file_id = transfer.file_id,
            .status = std::string(to_string(transfer.status)),
            .sender_progress = transfer.sent_progress,
            .receiver_progress = transfer.received_progress,
            .sync_lag = std::max(0.0, transfer.sent_progress - transfer.received_progress),
            .duplicates_rejected = transfer.duplicate_chunks,
            .last_chunk_time = to_unix_millis(transfer.last_chunk_time, now),
            .degraded = false,
        };
    }

} // namespace sharerelay::server
