#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharerelay/error_codes.hpp"
#include "sharerelay/protocol.hpp"
#include "sharerelay/server/config.hpp"
#include "sharerelay/server/connection_registry.hpp"
#include "sharerelay/server/transfer_tracker.hpp"

namespace sharerelay::server
{

    inline constexpr const char *kReasonPeerDisconnected = "peer disconnected";
    inline constexpr const char *kReasonPeerUnavailable = "peer unavailable";
    inline constexpr const char *kReasonRecoveryExhausted = "recovery exhausted";
    inline constexpr const char *kReasonDeclined = "declined";

    // Dispatches inbound protocol messages, applies them to the tracker and
    // forwards payloads to the paired device through the registry.
    class MessageRouter
    {
    public:
        MessageRouter(ConnectionRegistry &registry, TransferTracker &tracker, SupervisorConfig policy);

        // Installs the registry disconnect listener that fails the device's transfers.
        void attach();

        // Refreshes liveness, validates the message and dispatches it. Malformed
        // or unknown messages are logged and dropped.
        void handle_message(const std::string &device_id, const nlohmann::json &message);

        void dispatch(const std::string &device_id, const protocol::InboundMessage &message);

        void on_device_disconnected(const std::string &device_id);

        bool broadcast_sync_status(const std::string &transfer_id);

        bool send_resume_directive(const Transfer &transfer, const std::vector<std::uint32_t> &missing_chunks,
                                   std::uint32_t attempt);

        bool fail_transfer(const std::string &transfer_id, const std::string &reason, ErrorCode code);

    private:
        void handle_register(const std::string &device_id, const protocol::RegisterMessage &message);
        void handle_ping(const std::string &device_id);
        void handle_transfer_request(const std::string &device_id, const protocol::TransferRequestMessage &message);
        void handle_transfer_response(const std::string &device_id, const protocol::TransferResponseMessage &message);
        void handle_file_chunk(const std::string &device_id, const protocol::FileChunkMessage &message);
        void handle_chunk_ack(const std::string &device_id, const protocol::ChunkAckMessage &message);
        void handle_transfer_complete(const std::string &device_id, const protocol::TransferCompleteMessage &message);
        void handle_resume_transfer(const std::string &device_id, const protocol::ResumeTransferMessage &message);
        void handle_cancel_transfer(const std::string &device_id, const protocol::CancelTransferMessage &message);

        void handle_delivery_failure(const std::string &transfer_id, const std::string &origin_id,
                                     const std::string &file_id);
        void notify_failed(const Transfer &transfer, ErrorCode code);
        void send_transfer_error(const std::string &device_id, const std::string &error, ErrorCode code,
                                 const std::string &file_id, const std::optional<std::string> &transfer_id);

        ConnectionRegistry &registry_;
        TransferTracker &tracker_;
        SupervisorConfig policy_;
    };

} // namespace sharerelay::server
