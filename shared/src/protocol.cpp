#include "sharerelay/protocol.hpp"

#include <array>
#include <limits>
#include <type_traits>

#include "sharerelay/encoding/base64.hpp"

namespace sharerelay::protocol
{

    namespace
    {

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
        };

        constexpr std::array<MessageTypeMapping, 18> kMessageTypeMappings{{
            {MessageType::Register, "register"},
            {MessageType::Registered, "registered"},
            {MessageType::Ping, "ping"},
            {MessageType::Pong, "pong"},
            {MessageType::Devices, "devices"},
            {MessageType::TransferRequest, "transfer-request"},
            {MessageType::TransferResponse, "transfer-response"},
            {MessageType::TransferAccepted, "transfer-accepted"},
            {MessageType::TransferRejected, "transfer-rejected"},
            {MessageType::FileChunk, "file-chunk"},
            {MessageType::ChunkAck, "chunk-ack"},
            {MessageType::TransferComplete, "transfer-complete"},
            {MessageType::ResumeTransfer, "resume-transfer"},
            {MessageType::CancelTransfer, "cancel-transfer"},
            {MessageType::TransferCancelled, "transfer-cancelled"},
            {MessageType::SyncStatus, "sync-status"},
            {MessageType::TransferError, "transfer-error"},
            {MessageType::TransferFailed, "transfer-failed"},
        }};

        struct AckStatusMapping
        {
            AckStatus status;
            std::string_view label;
        };

        constexpr std::array<AckStatusMapping, 3> kAckStatusMappings{{
            {AckStatus::Forwarded, "forwarded"},
            {AckStatus::Received, "received"},
            {AckStatus::Duplicate, "duplicate"},
        }};

        [[noreturn]] void throw_invalid(const std::string &message)
        {
            throw ProtocolError(ErrorCode::InvalidPayload, message);
        }

        const nlohmann::json &require(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                throw_invalid(std::string("Missing field: ") + key);
            }
            return *it;
        }

        std::string required_string(const nlohmann::json &json, const char *key)
        {
            const auto &value = require(json, key);
            if (!value.is_string())
            {
                throw_invalid(std::string("Field must be a string: ") + key);
            }
            auto text = value.get<std::string>();
            if (text.empty())
            {
                throw_invalid(std::string("Field must not be empty: ") + key);
            }
            return text;
        }

        std::string optional_string(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                return {};
            }
            return it->get<std::string>();
        }

        std::int64_t required_integer(const nlohmann::json &json, const char *key)
        {
            const auto &value = require(json, key);
            if (!value.is_number_integer())
            {
                throw_invalid(std::string("Field must be an integer: ") + key);
            }
            return value.get<std::int64_t>();
        }

        std::uint32_t to_chunk_index(const nlohmann::json &value, const char *key)
        {
            if (!value.is_number_integer())
            {
                throw_invalid(std::string("Chunk index must be an integer: ") + key);
            }
            const auto index = value.get<std::int64_t>();
            if (index < 0 || index > std::numeric_limits<std::uint32_t>::max())
            {
                throw ProtocolError(ErrorCode::InvalidChunkIndex, std::string("Chunk index out of range: ") + key);
            }
            return static_cast<std::uint32_t>(index);
        }

        std::vector<std::byte> decode_chunk(const nlohmann::json &value)
        {
            if (value.is_string())
            {
                auto decoded = encoding::decode_base64(value.get_ref<const std::string &>());
                if (!decoded)
                {
                    throw_invalid("Chunk payload is not valid base64");
                }
                return std::move(*decoded);
            }
            if (value.is_array())
            {
                std::vector<std::byte> bytes;
                bytes.reserve(value.size());
                for (const auto &element : value)
                {
                    if (!element.is_number_integer() || element.get<std::int64_t>() < 0 ||
                        element.get<std::int64_t>() > 0xFF)
                    {
                        throw_invalid("Chunk payload array must hold byte values");
                    }
                    bytes.push_back(static_cast<std::byte>(element.get<std::int64_t>()));
                }
                return bytes;
            }
            throw_invalid("Chunk payload must be a base64 string or a byte array");
        }

        template <typename Message>
        InboundMessage parse_as(const nlohmann::json &fields)
        {
            if constexpr (std::is_same_v<Message, PingMessage>)
            {
                return PingMessage{};
            }
            else
            {
                return fields.get<Message>();
            }
        }

    } // namespace

    ProtocolError::ProtocolError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(AckStatus status) noexcept
    {
        for (const auto &mapping : kAckStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<AckStatus> ack_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kAckStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const FileInfo &info)
    {
        json = {
            {"name", info.name},
            {"size", info.size},
            {"type", info.type},
            {"totalChunks", info.total_chunks},
            {"chunkSize", info.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, FileInfo &info)
    {
        if (!json.is_object())
        {
            throw_invalid("fileInfo must be an object");
        }
        info.name = required_string(json, "name");
        const auto size = required_integer(json, "size");
        if (size < 0)
        {
            throw_invalid("fileInfo.size must not be negative");
        }
        info.size = static_cast<std::uint64_t>(size);
        info.type = optional_string(json, "type");
        const auto total_chunks = required_integer(json, "totalChunks");
        if (total_chunks <= 0 || total_chunks > std::numeric_limits<std::uint32_t>::max())
        {
            throw_invalid("fileInfo.totalChunks must be positive");
        }
        info.total_chunks = static_cast<std::uint32_t>(total_chunks);
        const auto chunk_size = json.value("chunkSize", std::int64_t{0});
        info.chunk_size = chunk_size > 0 ? static_cast<std::uint64_t>(chunk_size) : 0;
    }

    void from_json(const nlohmann::json &json, RegisterMessage &message)
    {
        auto name = optional_string(json, "deviceName");
        if (name.empty())
        {
            message.device_name.reset();
        }
        else
        {
            message.device_name = std::move(name);
        }
    }

    void from_json(const nlohmann::json &json, TransferRequestMessage &message)
    {
        message.to_user_id = required_string(json, "toUserId");
        message.file_info = require(json, "fileInfo").get<FileInfo>();
        message.file_id = required_string(json, "fileId");
    }

    void from_json(const nlohmann::json &json, TransferResponseMessage &message)
    {
        message.to_user_id = required_string(json, "toUserId");
        const auto &accepted = require(json, "accepted");
        if (!accepted.is_boolean())
        {
            throw_invalid("Field must be a boolean: accepted");
        }
        message.accepted = accepted.get<bool>();
        message.file_id = required_string(json, "fileId");
        auto reason = optional_string(json, "reason");
        if (reason.empty())
        {
            message.reason.reset();
        }
        else
        {
            message.reason = std::move(reason);
        }
    }

    void from_json(const nlohmann::json &json, FileChunkMessage &message)
    {
        message.to_user_id = optional_string(json, "toUserId");
        message.file_id = required_string(json, "fileId");
        message.chunk_index = required_integer(json, "chunkIndex");
        message.total_chunks = required_integer(json, "totalChunks");
        message.chunk = decode_chunk(require(json, "chunk"));
    }

    void from_json(const nlohmann::json &json, ChunkAckMessage &message)
    {
        message.to_user_id = required_string(json, "toUserId");
        message.file_id = required_string(json, "fileId");
        message.chunk_index = required_integer(json, "chunkIndex");
        const auto label = required_string(json, "status");
        auto status = ack_status_from_string(label);
        if (!status)
        {
            throw_invalid("Unknown chunk-ack status: " + label);
        }
        message.status = *status;
    }

    void from_json(const nlohmann::json &json, TransferCompleteMessage &message)
    {
        message.to_user_id = required_string(json, "toUserId");
        message.file_id = required_string(json, "fileId");
    }

    void from_json(const nlohmann::json &json, ResumeTransferMessage &message)
    {
        message.to_user_id = required_string(json, "toUserId");
        message.file_id = required_string(json, "fileId");
        message.from_chunk.reset();
        message.missing_chunks.clear();
        if (auto it = json.find("fromChunk"); it != json.end() && !it->is_null())
        {
            message.from_chunk = to_chunk_index(*it, "fromChunk");
        }
        if (auto it = json.find("missingChunks"); it != json.end() && !it->is_null())
        {
            if (!it->is_array())
            {
                throw_invalid("Field must be an array: missingChunks");
            }
            for (const auto &element : *it)
            {
                message.missing_chunks.push_back(to_chunk_index(element, "missingChunks"));
            }
        }
        if (!message.from_chunk && message.missing_chunks.empty())
        {
            throw_invalid("resume-transfer requires fromChunk or missingChunks");
        }
    }

    void from_json(const nlohmann::json &json, CancelTransferMessage &message)
    {
        message.transfer_id = required_string(json, "transferId");
        auto reason = optional_string(json, "reason");
        if (reason.empty())
        {
            message.reason.reset();
        }
        else
        {
            message.reason = std::move(reason);
        }
    }

    InboundMessage parse_inbound(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ProtocolError(ErrorCode::InvalidMessage, "Message must be a JSON object");
        }
        auto type_it = json.find("type");
        if (type_it == json.end() || !type_it->is_string())
        {
            throw ProtocolError(ErrorCode::InvalidMessage, "Message has no type");
        }
        const auto label = type_it->get<std::string>();
        const auto type = message_type_from_string(label);
        if (!type)
        {
            throw ProtocolError(ErrorCode::Unsupported, "Unknown message type: " + label);
        }

        const auto data_it = json.find("data");
        const auto &fields = (data_it != json.end() && data_it->is_object()) ? *data_it : json;

        try
        {
            switch (*type)
            {
            case MessageType::Register:
                return parse_as<RegisterMessage>(fields);
            case MessageType::Ping:
                return parse_as<PingMessage>(fields);
            case MessageType::TransferRequest:
                return parse_as<TransferRequestMessage>(fields);
            case MessageType::TransferResponse:
                return parse_as<TransferResponseMessage>(fields);
            case MessageType::FileChunk:
                return parse_as<FileChunkMessage>(fields);
            case MessageType::ChunkAck:
                return parse_as<ChunkAckMessage>(fields);
            case MessageType::TransferComplete:
                return parse_as<TransferCompleteMessage>(fields);
            case MessageType::ResumeTransfer:
                return parse_as<ResumeTransferMessage>(fields);
            case MessageType::CancelTransfer:
                return parse_as<CancelTransferMessage>(fields);
            default:
                break;
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(ErrorCode::InvalidPayload, label + ": " + ex.what());
        }
        throw ProtocolError(ErrorCode::Unsupported, "Message type is outbound only: " + label);
    }

    MessageType message_type(const InboundMessage &message) noexcept
    {
        constexpr std::array<MessageType, std::variant_size_v<InboundMessage>> kTypes{{
            MessageType::Register,
            MessageType::Ping,
            MessageType::TransferRequest,
            MessageType::TransferResponse,
            MessageType::FileChunk,
            MessageType::ChunkAck,
            MessageType::TransferComplete,
            MessageType::ResumeTransfer,
            MessageType::CancelTransfer,
        }};
        return kTypes[message.index()];
    }

    void to_json(nlohmann::json &json, const SyncStatus &status)
    {
        json = {
            {"transferId", status.transfer_id},
            {"senderId", status.sender_id},
            {"receiverId", status.receiver_id},
            {"fileId", status.file_id},
            {"status", status.status},
            {"senderProgress", status.sender_progress},
            {"receiverProgress", status.receiver_progress},
            {"syncLag", status.sync_lag},
            {"duplicatesRejected", status.duplicates_rejected},
            {"lastChunkTime", status.last_chunk_time},
            {"degraded", status.degraded},
        };
    }

    void from_json(const nlohmann::json &json, SyncStatus &status)
    {
        status.transfer_id = json.value("transferId", std::string{});
        status.sender_id = json.at("senderId").get<std::string>();
        status.receiver_id = json.at("receiverId").get<std::string>();
        status.file_id = json.at("fileId").get<std::string>();
        status.status = json.value("status", std::string{});
        status.sender_progress = json.value("senderProgress", 0.0);
        status.receiver_progress = json.value("receiverProgress", 0.0);
        status.sync_lag = json.value("syncLag", 0.0);
        status.duplicates_rejected = json.value("duplicatesRejected", std::uint64_t{0});
        status.last_chunk_time = json.value("lastChunkTime", std::int64_t{0});
        status.degraded = json.value("degraded", false);
    }

    nlohmann::json make_message(MessageType type, nlohmann::json fields)
    {
        if (!fields.is_object())
        {
            throw std::invalid_argument("Message fields must be a JSON object");
        }
        fields["type"] = to_string(type);
        return fields;
    }

    std::string encode_chunk(const std::vector<std::byte> &chunk)
    {
        return encoding::encode_base64(chunk);
    }

} // namespace sharerelay::protocol
