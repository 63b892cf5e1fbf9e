#include "sharerelay/server/message_router.hpp"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "sharerelay/server/sync_supervisor.hpp"

namespace sharerelay::server
{

    MessageRouter::MessageRouter(ConnectionRegistry &registry, TransferTracker &tracker, SupervisorConfig policy)
        : registry_(registry), tracker_(tracker), policy_(policy) {}

    void MessageRouter::attach()
    {
        registry_.set_disconnect_listener([this](const std::string &device_id)
                                          { on_device_disconnected(device_id); });
    }

    void MessageRouter::handle_message(const std::string &device_id, const nlohmann::json &message)
    {
        if (!registry_.touch(device_id))
        {
            spdlog::warn("Dropping message from unregistered device {}", device_id);
            return;
        }

        protocol::InboundMessage inbound;
        try
        {
            inbound = protocol::parse_inbound(message);
        }
        catch (const protocol::ProtocolError &ex)
        {
            spdlog::warn("Dropping message from {}: {} ({})", device_id, ex.what(), to_string(ex.code()));
            return;
        }

        dispatch(device_id, inbound);
    }

    void MessageRouter::dispatch(const std::string &device_id, const protocol::InboundMessage &message)
    {
        using protocol::MessageType;

        const auto type = protocol::message_type(message);
        spdlog::trace("{} -> {}", device_id, protocol::to_string(type));

        switch (type)
        {
        case MessageType::Register:
            handle_register(device_id, std::get<protocol::RegisterMessage>(message));
            break;
        case MessageType::Ping:
            handle_ping(device_id);
            break;
        case MessageType::TransferRequest:
            handle_transfer_request(device_id, std::get<protocol::TransferRequestMessage>(message));
            break;
        case MessageType::TransferResponse:
            handle_transfer_response(device_id, std::get<protocol::TransferResponseMessage>(message));
            break;
        case MessageType::FileChunk:
            handle_file_chunk(device_id, std::get<protocol::FileChunkMessage>(message));
            break;
        case MessageType::ChunkAck:
            handle_chunk_ack(device_id, std::get<protocol::ChunkAckMessage>(message));
            break;
        case MessageType::TransferComplete:
            handle_transfer_complete(device_id, std::get<protocol::TransferCompleteMessage>(message));
            break;
        case MessageType::ResumeTransfer:
            handle_resume_transfer(device_id, std::get<protocol::ResumeTransferMessage>(message));
            break;
        case MessageType::CancelTransfer:
            handle_cancel_transfer(device_id, std::get<protocol::CancelTransferMessage>(message));
            break;
        default:
            spdlog::warn("Unsupported message {} from {}", protocol::to_string(type), device_id);
            break;
        }
    }

    void MessageRouter::handle_register(const std::string &device_id, const protocol::RegisterMessage &message)
    {
        if (message.device_name)
        {
            registry_.set_device_name(device_id, *message.device_name);
        }
    }

    void MessageRouter::handle_ping(const std::string &device_id)
    {
        nlohmann::json fields;
        fields["timestamp"] = unix_millis_now();
        if (!registry_.send(device_id, protocol::MessageType::Pong, std::move(fields)))
        {
            spdlog::debug("Pong to {} not delivered", device_id);
        }
    }

    void MessageRouter::on_device_disconnected(const std::string &device_id)
    {
        const auto failed = tracker_.fail_transfers_for_device(device_id, kReasonPeerDisconnected);
        for (const auto &transfer : failed)
        {
            spdlog::info("Transfer {} failed: {} left", transfer.transfer_id, device_id);
            notify_failed(transfer, ErrorCode::PeerDisconnected);
        }
    }

    bool MessageRouter::broadcast_sync_status(const std::string &transfer_id)
    {
        auto status = tracker_.sync_status(transfer_id);
        if (!status)
        {
            return false;
        }
        status->degraded = is_degraded(*status, policy_);

        const auto message = protocol::make_message(protocol::MessageType::SyncStatus, nlohmann::json(*status));
        const bool to_sender = registry_.send(status->sender_id, message);
        const bool to_receiver = registry_.send(status->receiver_id, message);
        return to_sender && to_receiver;
    }

    bool MessageRouter::send_resume_directive(const Transfer &transfer,
                                              const std::vector<std::uint32_t> &missing_chunks,
                                              std::uint32_t attempt)
    {
        if (missing_chunks.empty())
        {
            return false;
        }
        nlohmann::json fields;
        fields["from"] = transfer.receiver_id;
        fields["fileId"] = transfer.file_id;
        fields["transferId"] = transfer.transfer_id;
        fields["fromChunk"] = missing_chunks.front();
        fields["missingChunks"] = missing_chunks;
        fields["attempt"] = attempt;

        if (!registry_.send(transfer.sender_id, protocol::MessageType::ResumeTransfer, std::move(fields)))
        {
            handle_delivery_failure(transfer.transfer_id, transfer.receiver_id, transfer.file_id);
            return false;
        }
        spdlog::info("Resume directive {} for {} ({} chunks missing)", attempt, transfer.transfer_id,
                     missing_chunks.size());
        return true;
    }

    bool MessageRouter::fail_transfer(const std::string &transfer_id, const std::string &reason, ErrorCode code)
    {
        const auto failed = tracker_.mark_failed(transfer_id, reason);
        if (!failed)
        {
            return false;
        }
        spdlog::warn("Transfer {} failed: {}", transfer_id, reason);
        notify_failed(*failed, code);
        return true;
    }

    void MessageRouter::handle_delivery_failure(const std::string &transfer_id, const std::string &origin_id,
                                                const std::string &file_id)
    {
        if (tracker_.mark_failed(transfer_id, kReasonPeerUnavailable))
        {
            spdlog::warn("Transfer {} failed: peer unavailable", transfer_id);
        }
        send_transfer_error(origin_id, kReasonPeerUnavailable, ErrorCode::PeerUnavailable, file_id, transfer_id);
    }

    void MessageRouter::notify_failed(const Transfer &transfer, ErrorCode code)
    {
        nlohmann::json fields;
        fields["transferId"] = transfer.transfer_id;
        fields["fileId"] = transfer.file_id;
        fields["senderId"] = transfer.sender_id;
        fields["receiverId"] = transfer.receiver_id;
        fields["reason"] = transfer.failure_reason.value_or(std::string(to_string(code)));
        fields["code"] = to_string(code);

        const auto message = protocol::make_message(protocol::MessageType::TransferFailed, std::move(fields));
        for (const auto *participant : {&transfer.sender_id, &transfer.receiver_id})
        {
            if (!registry_.send(*participant, message))
            {
                spdlog::debug("Failure of {} not delivered to {}", transfer.transfer_id, *participant);
            }
        }
    }

    void MessageRouter::send_transfer_error(const std::string &device_id, const std::string &error, ErrorCode code,
                                            const std::string &file_id,
                                            const std::optional<std::string> &transfer_id)
    {
        nlohmann::json fields;
        fields["error"] = error;
        fields["code"] = to_string(code);
        fields["fileId"] = file_id;
        if (transfer_id)
        {
            fields["transferId"] = *transfer_id;
        }
        if (!registry_.send(device_id, protocol::MessageType::TransferError, std::move(fields)))
        {
            spdlog::debug("transfer-error for {} not delivered to {}", file_id, device_id);
        }
    }

} // namespace sharerelay::server
