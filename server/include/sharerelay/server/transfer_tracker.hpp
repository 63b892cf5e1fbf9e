#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sharerelay/protocol.hpp"
#include "sharerelay/server/clock.hpp"

namespace sharerelay::server
{

    enum class TransferStatus : std::uint8_t
    {
        Pending,
        Active,
        Completed,
        Failed
    };

    std::string_view to_string(TransferStatus status) noexcept;

    constexpr bool is_terminal(TransferStatus status) noexcept
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed;
    }

    struct Transfer
    {
        std::string transfer_id;
        std::string sender_id;
        std::string receiver_id;
        std::string file_id;
        protocol::FileInfo file_info;
        TransferStatus status{TransferStatus::Pending};
        double sent_progress{};
        double received_progress{};
        std::uint64_t duplicate_chunks{};
        // Highest chunk index seen in each direction; -1 before the first one.
        std::int64_t sent_high_water{-1};
        std::int64_t received_high_water{-1};
        // One bit per chunk, set once the receiver has acknowledged it.
        std::vector<bool> acknowledged;
        std::uint32_t acknowledged_count{};
        TimePoint created_at{};
        TimePoint last_chunk_time{};
        std::optional<TimePoint> completed_at{};
        std::optional<std::string> failure_reason{};
    };

    class DuplicateTransferError : public std::runtime_error
    {
    public:
        explicit DuplicateTransferError(const std::string &transfer_id);

        const std::string &transfer_id() const noexcept { return transfer_id_; }

    private:
        std::string transfer_id_;
    };

    struct AckResult
    {
        Transfer transfer;
        bool duplicate{};
    };

    // Owns every Transfer keyed by transfer ID. Operations on unknown IDs are
    // reported through empty results, never by throwing.
    class TransferTracker
    {
    public:
        explicit TransferTracker(ClockSource clock = steady_clock_source());

        static std::string make_transfer_id(std::string_view sender_id, std::string_view receiver_id,
                                            std::string_view file_id);

        // Throws DuplicateTransferError if (sender, receiver, file) is already tracked.
        Transfer create_transfer(const std::string &sender_id, const std::string &receiver_id,
                                 const std::string &file_id, const protocol::FileInfo &file_info);

        // pending -> active. Returns the updated transfer, or nullopt from any other state.
        std::optional<Transfer> activate(const std::string &transfer_id);

        // Drops the entry regardless of state; used for reject and cancel.
        std::optional<Transfer> remove(const std::string &transfer_id);

        std::optional<Transfer> record_chunk_sent(const std::string &transfer_id, std::uint32_t chunk_index,
                                                  std::uint32_t total_chunks);

        std::optional<AckResult> record_chunk_ack(const std::string &transfer_id, std::uint32_t chunk_index,
                                                  std::uint32_t total_chunks, bool is_duplicate);

        // active -> completed. A second call is a no-op returning false.
        bool mark_complete(const std::string &transfer_id);

        // Any non-terminal state -> failed. The entry is removed and returned so
        // the caller can notify both peers.
        std::optional<Transfer> mark_failed(const std::string &transfer_id, const std::string &reason);

        std::vector<Transfer> fail_transfers_for_device(const std::string &device_id, const std::string &reason);

        std::vector<std::uint32_t> compute_missing_chunks(const std::string &transfer_id) const;

        std::optional<Transfer> find(const std::string &transfer_id) const;
        std::optional<Transfer> find_by_sender(const std::string &sender_id, const std::string &file_id) const;
        std::optional<protocol::SyncStatus> sync_status(const std::string &transfer_id) const;
        std::vector<Transfer> active_transfers() const;
        std::size_t size() const;

        // Deletes completed transfers whose grace period has elapsed.
        std::size_t purge_completed(std::chrono::milliseconds grace);

        static protocol::SyncStatus make_sync_status(const Transfer &transfer, TimePoint now);

    private:
        ClockSource clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Transfer> transfers_;
    };

} // namespace sharerelay::server
