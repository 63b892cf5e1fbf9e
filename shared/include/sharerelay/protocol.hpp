/**
 * ShareRelay - Relay protocol messages and JSON (de)serialization.
 *
 * Every message is a JSON object tagged by "type". Inbound messages are
 * validated once at the boundary by parse_inbound() and handed to the
 * router as one of the InboundMessage alternatives.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharerelay/error_codes.hpp"

namespace sharerelay::protocol
{

    enum class MessageType : std::uint8_t
    {
        Register,
        Registered,
        Ping,
        Pong,
        Devices,
        TransferRequest,
        TransferResponse,
        TransferAccepted,
        TransferRejected,
        FileChunk,
        ChunkAck,
        TransferComplete,
        ResumeTransfer,
        CancelTransfer,
        TransferCancelled,
        SyncStatus,
        TransferError,
        TransferFailed
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    enum class AckStatus : std::uint8_t
    {
        Forwarded,
        Received,
        Duplicate
    };

    std::string_view to_string(AckStatus status) noexcept;
    std::optional<AckStatus> ack_status_from_string(std::string_view value) noexcept;

    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct FileInfo
    {
        std::string name;
        std::uint64_t size{};
        std::string type;
        std::uint32_t total_chunks{};
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const FileInfo &info);
    void from_json(const nlohmann::json &json, FileInfo &info);

    struct RegisterMessage
    {
        std::optional<std::string> device_name{};
    };

    struct PingMessage
    {
    };

    struct TransferRequestMessage
    {
        std::string to_user_id;
        FileInfo file_info;
        std::string file_id;
    };

    struct TransferResponseMessage
    {
        std::string to_user_id;
        bool accepted{};
        std::string file_id;
        std::optional<std::string> reason{};
    };

    // Indices are signed so that negative values survive parsing and are
    // rejected by the router's range check instead of wrapping around.
    struct FileChunkMessage
    {
        std::string to_user_id;
        std::string file_id;
        std::int64_t chunk_index{};
        std::int64_t total_chunks{};
        std::vector<std::byte> chunk;
    };

    struct ChunkAckMessage
    {
        std::string to_user_id;
        std::string file_id;
        std::int64_t chunk_index{};
        AckStatus status{AckStatus::Received};
    };

    struct TransferCompleteMessage
    {
        std::string to_user_id;
        std::string file_id;
    };

    struct ResumeTransferMessage
    {
        std::string to_user_id;
        std::string file_id;
        std::optional<std::uint32_t> from_chunk{};
        std::vector<std::uint32_t> missing_chunks;
    };

    struct CancelTransferMessage
    {
        std::string transfer_id;
        std::optional<std::string> reason{};
    };

    void from_json(const nlohmann::json &json, RegisterMessage &message);
    void from_json(const nlohmann::json &json, TransferRequestMessage &message);
    void from_json(const nlohmann::json &json, TransferResponseMessage &message);
    void from_json(const nlohmann::json &json, FileChunkMessage &message);
    void from_json(const nlohmann::json &json, ChunkAckMessage &message);
    void from_json(const nlohmann::json &json, TransferCompleteMessage &message);
    void from_json(const nlohmann::json &json, ResumeTransferMessage &message);
    void from_json(const nlohmann::json &json, CancelTransferMessage &message);

    using InboundMessage = std::variant<RegisterMessage,
                                        PingMessage,
                                        TransferRequestMessage,
                                        TransferResponseMessage,
                                        FileChunkMessage,
                                        ChunkAckMessage,
                                        TransferCompleteMessage,
                                        ResumeTransferMessage,
                                        CancelTransferMessage>;

    // Accepts fields either at the top level or nested under "data".
    // Throws ProtocolError for unknown types, outbound-only types and malformed fields.
    InboundMessage parse_inbound(const nlohmann::json &json);

    MessageType message_type(const InboundMessage &message) noexcept;

    // Two-sided progress snapshot broadcast as "sync-status".
    struct SyncStatus
    {
        std::string transfer_id;
        std::string sender_id;
        std::string receiver_id;
        std::string file_id;
        std::string status;
        double sender_progress{};
        double receiver_progress{};
        double sync_lag{};
        std::uint64_t duplicates_rejected{};
        std::int64_t last_chunk_time{};
        bool degraded{};
    };

    void to_json(nlohmann::json &json, const SyncStatus &status);
    void from_json(const nlohmann::json &json, SyncStatus &status);

    // Builds {"type": <type>, ...fields}; fields must be a JSON object.
    nlohmann::json make_message(MessageType type, nlohmann::json fields = nlohmann::json::object());

    std::string encode_chunk(const std::vector<std::byte> &chunk);

} // namespace sharerelay::protocol
