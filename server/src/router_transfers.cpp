#include "sharerelay/server/message_router.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace sharerelay::server
{

    namespace
    {

        bool chunk_in_range(std::int64_t chunk_index, std::uint32_t total_chunks)
        {
            return chunk_index >= 0 && chunk_index < static_cast<std::int64_t>(total_chunks);
        }

        // An empty file still travels as one chunk.
        bool chunk_count_matches_size(const protocol::FileInfo &file_info)
        {
            if (file_info.chunk_size == 0)
            {
                return true;
            }
            const auto expected =
                file_info.size == 0 ? std::uint64_t{1}
                                    : (file_info.size - 1) / file_info.chunk_size + 1;
            return expected == file_info.total_chunks;
        }

    } // namespace

    void MessageRouter::handle_transfer_request(const std::string &device_id,
                                                const protocol::TransferRequestMessage &message)
    {
        if (message.to_user_id == device_id)
        {
            send_transfer_error(device_id, "Cannot send a file to the same device", ErrorCode::InvalidPayload,
                                message.file_id, std::nullopt);
            return;
        }
        if (message.file_info.total_chunks > policy_.max_chunks)
        {
            spdlog::warn("Transfer request from {} declares {} chunks (limit {})", device_id,
                         message.file_info.total_chunks, policy_.max_chunks);
            send_transfer_error(device_id, "Too many chunks", ErrorCode::InvalidPayload, message.file_id,
                                std::nullopt);
            return;
        }
        if (!chunk_count_matches_size(message.file_info))
        {
            spdlog::warn("Transfer request from {} has {} chunks for {} bytes in {}-byte chunks", device_id,
                         message.file_info.total_chunks, message.file_info.size, message.file_info.chunk_size);
            send_transfer_error(device_id, "Chunk count does not match file size", ErrorCode::InvalidPayload,
                                message.file_id, std::nullopt);
            return;
        }
        if (!registry_.is_reachable(message.to_user_id))
        {
            spdlog::warn("Transfer request from {} for unknown device {}", device_id, message.to_user_id);
            send_transfer_error(device_id, "Target user not found", ErrorCode::UnknownDevice, message.file_id,
                                std::nullopt);
            return;
        }

        Transfer transfer;
        try
        {
            transfer = tracker_.create_transfer(device_id, message.to_user_id, message.file_id, message.file_info);
        }
        catch (const DuplicateTransferError &ex)
        {
            spdlog::warn("Rejecting duplicate request {}", ex.transfer_id());
            send_transfer_error(device_id, "Duplicate transfer request", ErrorCode::DuplicateTransfer,
                                message.file_id, ex.transfer_id());
            return;
        }

        spdlog::info("Transfer {} requested: '{}' ({} bytes, {} chunks)", transfer.transfer_id,
                     transfer.file_info.name, transfer.file_info.size, transfer.file_info.total_chunks);

        nlohmann::json fields;
        fields["from"] = device_id;
        fields["fileInfo"] = transfer.file_info;
        fields["fileId"] = transfer.file_id;
        fields["transferId"] = transfer.transfer_id;
        if (!registry_.send(transfer.receiver_id, protocol::MessageType::TransferRequest, std::move(fields)))
        {
            handle_delivery_failure(transfer.transfer_id, device_id, transfer.file_id);
        }
    }

    void MessageRouter::handle_transfer_response(const std::string &device_id,
                                                 const protocol::TransferResponseMessage &message)
    {
        const auto transfer_id = TransferTracker::make_transfer_id(message.to_user_id, device_id, message.file_id);
        const auto transfer = tracker_.find(transfer_id);
        if (!transfer)
        {
            spdlog::warn("Response from {} for unknown transfer {}", device_id, transfer_id);
            send_transfer_error(device_id, "Unknown transfer", ErrorCode::UnknownTransfer, message.file_id,
                                transfer_id);
            return;
        }
        if (transfer->status != TransferStatus::Pending)
        {
            spdlog::warn("Response for transfer {} in state {} ignored", transfer_id, to_string(transfer->status));
            send_transfer_error(device_id, "Transfer is no longer awaiting a response", ErrorCode::InvalidState,
                                message.file_id, transfer_id);
            return;
        }

        if (message.accepted)
        {
            if (!tracker_.activate(transfer_id))
            {
                return;
            }
            spdlog::info("Transfer {} accepted", transfer_id);
            nlohmann::json fields;
            fields["fromUserId"] = device_id;
            fields["fileId"] = message.file_id;
            fields["transferId"] = transfer_id;
            if (!registry_.send(transfer->sender_id, protocol::MessageType::TransferAccepted, std::move(fields)))
            {
                handle_delivery_failure(transfer_id, device_id, message.file_id);
            }
            return;
        }

        tracker_.remove(transfer_id);
        const auto reason = message.reason.value_or(kReasonDeclined);
        spdlog::info("Transfer {} rejected: {}", transfer_id, reason);
        nlohmann::json fields;
        fields["fromUserId"] = device_id;
        fields["reason"] = reason;
        fields["fileId"] = message.file_id;
        fields["transferId"] = transfer_id;
        if (!registry_.send(transfer->sender_id, protocol::MessageType::TransferRejected, std::move(fields)))
        {
            spdlog::debug("Rejection of {} not delivered to {}", transfer_id, transfer->sender_id);
        }
    }

    void MessageRouter::handle_file_chunk(const std::string &device_id, const protocol::FileChunkMessage &message)
    {
        const auto transfer =
            message.to_user_id.empty()
                ? tracker_.find_by_sender(device_id, message.file_id)
                : tracker_.find(TransferTracker::make_transfer_id(device_id, message.to_user_id, message.file_id));
        if (!transfer || transfer->status != TransferStatus::Active)
        {
            spdlog::debug("Dropping chunk {} of {} from {}: no active transfer", message.chunk_index, message.file_id,
                          device_id);
            return;
        }

        const auto total_chunks = transfer->file_info.total_chunks;
        if (!chunk_in_range(message.chunk_index, total_chunks) ||
            message.total_chunks != static_cast<std::int64_t>(total_chunks))
        {
            spdlog::warn("Dropping chunk {}/{} on {}: expected index below {}", message.chunk_index,
                         message.total_chunks, transfer->transfer_id, total_chunks);
            return;
        }
        const auto chunk_index = static_cast<std::uint32_t>(message.chunk_index);

        // The entry may have been cancelled since the lookup above.
        const auto updated = tracker_.record_chunk_sent(transfer->transfer_id, chunk_index, total_chunks);
        if (!updated)
        {
            return;
        }

        nlohmann::json forward;
        forward["from"] = device_id;
        forward["fileId"] = updated->file_id;
        forward["transferId"] = updated->transfer_id;
        forward["chunkIndex"] = chunk_index;
        forward["totalChunks"] = total_chunks;
        forward["chunk"] = protocol::encode_chunk(message.chunk);
        forward["progress"] = updated->sent_progress;
        if (!registry_.send(updated->receiver_id, protocol::MessageType::FileChunk, std::move(forward)))
        {
            handle_delivery_failure(updated->transfer_id, device_id, updated->file_id);
            return;
        }
        spdlog::debug("Chunk {}/{} of {} forwarded ({} bytes)", chunk_index + 1, total_chunks, updated->transfer_id,
                      message.chunk.size());

        nlohmann::json ack;
        ack["fileId"] = updated->file_id;
        ack["transferId"] = updated->transfer_id;
        ack["chunkIndex"] = chunk_index;
        ack["status"] = protocol::to_string(protocol::AckStatus::Forwarded);
        ack["senderProgress"] = updated->sent_progress;
        if (!registry_.send(device_id, protocol::MessageType::ChunkAck, std::move(ack)))
        {
            spdlog::debug("Local ack for chunk {} not delivered to {}", chunk_index, device_id);
        }
    }

    void MessageRouter::handle_chunk_ack(const std::string &device_id, const protocol::ChunkAckMessage &message)
    {
        if (message.status == protocol::AckStatus::Forwarded)
        {
            spdlog::warn("Dropping forwarded-status ack from {}", device_id);
            return;
        }

        const auto transfer_id = TransferTracker::make_transfer_id(message.to_user_id, device_id, message.file_id);
        const auto transfer = tracker_.find(transfer_id);
        if (!transfer)
        {
            spdlog::warn("Ack from {} for unknown transfer {}", device_id, transfer_id);
            return;
        }
        const auto total_chunks = transfer->file_info.total_chunks;
        if (!chunk_in_range(message.chunk_index, total_chunks))
        {
            spdlog::warn("Dropping ack for chunk {} on {}: expected index below {}", message.chunk_index, transfer_id,
                         total_chunks);
            return;
        }
        const auto chunk_index = static_cast<std::uint32_t>(message.chunk_index);

        const auto result = tracker_.record_chunk_ack(transfer_id, chunk_index, total_chunks,
                                                      message.status == protocol::AckStatus::Duplicate);
        if (!result)
        {
            return;
        }
        if (result->duplicate)
        {
            spdlog::debug("Duplicate chunk {} on {} ({} so far)", chunk_index, transfer_id,
                          result->transfer.duplicate_chunks);
        }

        const auto status = result->duplicate ? protocol::AckStatus::Duplicate : protocol::AckStatus::Received;
        nlohmann::json forward;
        forward["from"] = device_id;
        forward["fileId"] = message.file_id;
        forward["transferId"] = transfer_id;
        forward["chunkIndex"] = chunk_index;
        forward["status"] = protocol::to_string(status);
        forward["receiverProgress"] = result->transfer.received_progress;
        if (!registry_.send(transfer->sender_id, protocol::MessageType::ChunkAck, std::move(forward)))
        {
            handle_delivery_failure(transfer_id, device_id, message.file_id);
            return;
        }

        broadcast_sync_status(transfer_id);
    }

    void MessageRouter::handle_transfer_complete(const std::string &device_id,
                                                 const protocol::TransferCompleteMessage &message)
    {
        const auto transfer_id = TransferTracker::make_transfer_id(device_id, message.to_user_id, message.file_id);
        const auto transfer = tracker_.find(transfer_id);
        if (!transfer)
        {
            spdlog::warn("Completion from {} for unknown transfer {}", device_id, transfer_id);
            return;
        }
        if (transfer->status != TransferStatus::Active)
        {
            spdlog::debug("Completion for transfer {} in state {} ignored", transfer_id, to_string(transfer->status));
            return;
        }

        nlohmann::json fields;
        fields["from"] = device_id;
        fields["fileId"] = message.file_id;
        fields["fileName"] = transfer->file_info.name;
        fields["transferId"] = transfer_id;
        if (!registry_.send(transfer->receiver_id, protocol::MessageType::TransferComplete, std::move(fields)))
        {
            handle_delivery_failure(transfer_id, device_id, message.file_id);
            return;
        }

        if (tracker_.mark_complete(transfer_id))
        {
            spdlog::info("Transfer {} completed", transfer_id);
            broadcast_sync_status(transfer_id);
        }
    }

    void MessageRouter::handle_resume_transfer(const std::string &device_id,
                                               const protocol::ResumeTransferMessage &message)
    {
        const auto transfer_id = TransferTracker::make_transfer_id(message.to_user_id, device_id, message.file_id);

        nlohmann::json fields;
        fields["from"] = device_id;
        fields["fileId"] = message.file_id;
        fields["transferId"] = transfer_id;
        if (message.from_chunk)
        {
            fields["fromChunk"] = *message.from_chunk;
        }
        if (!message.missing_chunks.empty())
        {
            fields["missingChunks"] = message.missing_chunks;
        }

        if (registry_.send(message.to_user_id, protocol::MessageType::ResumeTransfer, std::move(fields)))
        {
            spdlog::info("Resume of {} requested by {}", transfer_id, device_id);
            return;
        }
        if (tracker_.find(transfer_id))
        {
            handle_delivery_failure(transfer_id, device_id, message.file_id);
        }
        else
        {
            send_transfer_error(device_id, "Target user not found", ErrorCode::UnknownDevice, message.file_id,
                                std::nullopt);
        }
    }

    void MessageRouter::handle_cancel_transfer(const std::string &device_id,
                                               const protocol::CancelTransferMessage &message)
    {
        const auto transfer = tracker_.find(message.transfer_id);
        if (!transfer)
        {
            spdlog::debug("Cancel for unknown transfer {} from {}", message.transfer_id, device_id);
            return;
        }
        if (device_id != transfer->sender_id && device_id != transfer->receiver_id)
        {
            spdlog::warn("Device {} may not cancel transfer {}", device_id, message.transfer_id);
            send_transfer_error(device_id, "Not a participant of this transfer", ErrorCode::InvalidState,
                                transfer->file_id, message.transfer_id);
            return;
        }
        if (!tracker_.remove(message.transfer_id))
        {
            return;
        }

        const auto reason = message.reason.value_or("cancelled");
        spdlog::info("Transfer {} cancelled by {}: {}", message.transfer_id, device_id, reason);

        const auto &counterpart = device_id == transfer->sender_id ? transfer->receiver_id : transfer->sender_id;
        nlohmann::json fields;
        fields["transferId"] = message.transfer_id;
        fields["fileId"] = transfer->file_id;
        fields["reason"] = reason;
        fields["by"] = device_id;
        fields["code"] = to_string(ErrorCode::Cancelled);
        if (!registry_.send(counterpart, protocol::MessageType::TransferCancelled, std::move(fields)))
        {
            spdlog::debug("Cancellation of {} not delivered to {}", message.transfer_id, counterpart);
        }
    }

} // namespace sharerelay::server
