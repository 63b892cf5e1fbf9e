#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sharerelay/crypto.hpp"
#include "sharerelay/encoding/base64.hpp"
#include "sharerelay/error_codes.hpp"
#include "sharerelay/framing.hpp"
#include "sharerelay/protocol.hpp"

using namespace sharerelay;
using namespace sharerelay::protocol;

void run_server_component_tests();
void run_relay_scenario_tests();

namespace
{

    std::optional<ErrorCode> parse_error_code(const nlohmann::json &json)
    {
        try
        {
            parse_inbound(json);
        }
        catch (const ProtocolError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    nlohmann::json sample_file_info()
    {
        return {
            {"name", "a.txt"},
            {"size", 300},
            {"type", "text/plain"},
            {"totalChunks", 3},
            {"chunkSize", 100},
        };
    }

    void test_transfer_request_parsing()
    {
        const nlohmann::json flat = {
            {"type", "transfer-request"},
            {"toUserId", "b2c3d4"},
            {"fileId", "f1"},
            {"fileInfo", sample_file_info()},
        };
        const auto parsed = parse_inbound(flat);
        assert(message_type(parsed) == MessageType::TransferRequest);
        const auto &request = std::get<TransferRequestMessage>(parsed);
        assert(request.to_user_id == "b2c3d4");
        assert(request.file_id == "f1");
        assert(request.file_info.name == "a.txt");
        assert(request.file_info.size == 300);
        assert(request.file_info.total_chunks == 3);
        assert(request.file_info.chunk_size == 100);

        // Browser clients nest the payload under "data".
        const nlohmann::json nested = {
            {"type", "transfer-request"},
            {"data", {{"toUserId", "b2c3d4"}, {"fileId", "f1"}, {"fileInfo", sample_file_info()}}},
        };
        const auto from_nested = std::get<TransferRequestMessage>(parse_inbound(nested));
        assert(from_nested.to_user_id == request.to_user_id);
        assert(from_nested.file_info.total_chunks == 3);

        const auto echoed = nlohmann::json(request.file_info);
        assert(echoed.at("totalChunks").get<std::uint32_t>() == 3);
        assert(echoed.at("type") == "text/plain");
    }

    void test_response_and_ack_parsing()
    {
        const auto accepted = std::get<TransferResponseMessage>(parse_inbound({
            {"type", "transfer-response"},
            {"toUserId", "a1"},
            {"fileId", "f1"},
            {"accepted", true},
        }));
        assert(accepted.accepted);
        assert(!accepted.reason);

        const auto rejected = std::get<TransferResponseMessage>(parse_inbound({
            {"type", "transfer-response"},
            {"toUserId", "a1"},
            {"fileId", "f1"},
            {"accepted", false},
            {"reason", "busy"},
        }));
        assert(!rejected.accepted);
        assert(rejected.reason == "busy");

        const auto ack = std::get<ChunkAckMessage>(parse_inbound({
            {"type", "chunk-ack"},
            {"toUserId", "a1"},
            {"fileId", "f1"},
            {"chunkIndex", 2},
            {"status", "duplicate"},
        }));
        assert(ack.chunk_index == 2);
        assert(ack.status == AckStatus::Duplicate);

        const auto cancel = std::get<CancelTransferMessage>(parse_inbound({
            {"type", "cancel-transfer"},
            {"transferId", "a1-b2-f1"},
        }));
        assert(cancel.transfer_id == "a1-b2-f1");
        assert(!cancel.reason);

        const auto named = std::get<RegisterMessage>(parse_inbound({
            {"type", "register"},
            {"deviceName", "Kitchen laptop"},
        }));
        assert(named.device_name == "Kitchen laptop");
        assert(std::holds_alternative<PingMessage>(parse_inbound({{"type", "ping"}})));
    }

    void test_file_chunk_payloads()
    {
        const auto base64 = std::get<FileChunkMessage>(parse_inbound({
            {"type", "file-chunk"},
            {"toUserId", "b2"},
            {"fileId", "f1"},
            {"chunkIndex", 0},
            {"totalChunks", 3},
            {"chunk", "aGk="},
        }));
        assert(base64.chunk.size() == 2);
        assert(base64.chunk[0] == std::byte{'h'});
        assert(base64.chunk[1] == std::byte{'i'});
        assert(encode_chunk(base64.chunk) == "aGk=");

        const auto array = std::get<FileChunkMessage>(parse_inbound({
            {"type", "file-chunk"},
            {"fileId", "f1"},
            {"chunkIndex", 1},
            {"totalChunks", 3},
            {"chunk", {104, 105}},
        }));
        assert(array.to_user_id.empty());
        assert(array.chunk == base64.chunk);

        // Negative indices survive parsing; the router range-checks them.
        const auto negative = std::get<FileChunkMessage>(parse_inbound({
            {"type", "file-chunk"},
            {"toUserId", "b2"},
            {"fileId", "f1"},
            {"chunkIndex", -1},
            {"totalChunks", 3},
            {"chunk", ""},
        }));
        assert(negative.chunk_index == -1);
        assert(negative.chunk.empty());
    }

    void test_resume_parsing()
    {
        const auto resume = std::get<ResumeTransferMessage>(parse_inbound({
            {"type", "resume-transfer"},
            {"toUserId", "a1"},
            {"fileId", "f1"},
            {"missingChunks", {1, 4}},
        }));
        assert(!resume.from_chunk);
        assert((resume.missing_chunks == std::vector<std::uint32_t>{1, 4}));

        const auto from = std::get<ResumeTransferMessage>(parse_inbound({
            {"type", "resume-transfer"},
            {"toUserId", "a1"},
            {"fileId", "f1"},
            {"fromChunk", 7},
        }));
        assert(from.from_chunk == 7u);
        assert(from.missing_chunks.empty());
    }

    void test_rejected_messages()
    {
        assert(parse_error_code(nlohmann::json::array()) == ErrorCode::InvalidMessage);
        assert(parse_error_code({{"toUserId", "b2"}}) == ErrorCode::InvalidMessage);
        assert(parse_error_code({{"type", "teleport"}}) == ErrorCode::Unsupported);
        assert(parse_error_code({{"type", "sync-status"}}) == ErrorCode::Unsupported);
        assert(parse_error_code({{"type", "transfer-failed"}}) == ErrorCode::Unsupported);

        assert(parse_error_code({{"type", "transfer-request"}, {"fileId", "f1"}, {"fileInfo", sample_file_info()}}) ==
               ErrorCode::InvalidPayload);

        auto zero_chunks = sample_file_info();
        zero_chunks["totalChunks"] = 0;
        assert(parse_error_code({{"type", "transfer-request"},
                                 {"toUserId", "b2"},
                                 {"fileId", "f1"},
                                 {"fileInfo", zero_chunks}}) == ErrorCode::InvalidPayload);

        auto text_size = sample_file_info();
        text_size["size"] = "large";
        assert(parse_error_code({{"type", "transfer-request"},
                                 {"toUserId", "b2"},
                                 {"fileId", "f1"},
                                 {"fileInfo", text_size}}) == ErrorCode::InvalidPayload);

        assert(parse_error_code({{"type", "file-chunk"},
                                 {"toUserId", "b2"},
                                 {"fileId", "f1"},
                                 {"chunkIndex", 0},
                                 {"totalChunks", 3},
                                 {"chunk", "@@not base64@@"}}) == ErrorCode::InvalidPayload);
        assert(parse_error_code({{"type", "file-chunk"},
                                 {"toUserId", "b2"},
                                 {"fileId", "f1"},
                                 {"chunkIndex", 0},
                                 {"totalChunks", 3},
                                 {"chunk", {1, 300}}}) == ErrorCode::InvalidPayload);

        assert(parse_error_code({{"type", "chunk-ack"},
                                 {"toUserId", "a1"},
                                 {"fileId", "f1"},
                                 {"chunkIndex", 0},
                                 {"status", "lost"}}) == ErrorCode::InvalidPayload);
        assert(parse_error_code({{"type", "transfer-response"},
                                 {"toUserId", "a1"},
                                 {"fileId", "f1"},
                                 {"accepted", "yes"}}) == ErrorCode::InvalidPayload);

        assert(parse_error_code({{"type", "resume-transfer"}, {"toUserId", "a1"}, {"fileId", "f1"}}) ==
               ErrorCode::InvalidPayload);
        assert(parse_error_code({{"type", "resume-transfer"},
                                 {"toUserId", "a1"},
                                 {"fileId", "f1"},
                                 {"fromChunk", -2}}) == ErrorCode::InvalidChunkIndex);
    }

    void test_outbound_messages()
    {
        auto message = make_message(MessageType::TransferAccepted, {{"fileId", "f1"}});
        assert(message.at("type") == "transfer-accepted");
        assert(message.at("fileId") == "f1");

        bool threw = false;
        try
        {
            make_message(MessageType::Pong, nlohmann::json::array());
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        SyncStatus status{
            .transfer_id = "a1-b2-f1",
            .sender_id = "a1",
            .receiver_id = "b2",
            .file_id = "f1",
            .status = "active",
            .sender_progress = 50.0,
            .receiver_progress = 25.0,
            .sync_lag = 25.0,
            .duplicates_rejected = 2,
            .last_chunk_time = 1700000000000,
            .degraded = true,
        };
        const auto json = nlohmann::json(status);
        assert(json.at("senderProgress") == 50.0);
        assert(json.at("syncLag") == 25.0);
        assert(json.at("duplicatesRejected") == 2);
        assert(json.at("degraded") == true);
        const auto decoded = json.get<SyncStatus>();
        assert(decoded.transfer_id == status.transfer_id);
        assert(decoded.last_chunk_time == status.last_chunk_time);

        for (const auto label : {"register", "chunk-ack", "transfer-failed", "resume-transfer"})
        {
            const auto type = message_type_from_string(label);
            assert(type);
            assert(to_string(*type) == label);
        }
        assert(!message_type_from_string("transfer_request"));
    }

    void test_framing()
    {
        const nlohmann::json message = {{"type", "ping"}};
        const auto frame = encode_frame(message);
        const auto text = message.dump();
        assert(frame.size() == kFrameHeaderSize + text.size());
        assert(read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize)) ==
               text.size());

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial);
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), 2)));

        auto doubled = frame;
        doubled.insert(doubled.end(), frame.begin(), frame.end());
        const auto first = try_decode_frame(doubled);
        assert(first);
        assert(first->message == message);
        assert(first->bytes_consumed == frame.size());

        // Header and payload read into one buffer, as the session assembles them.
        std::vector<std::uint8_t> assembled(frame.begin(), frame.begin() + kFrameHeaderSize);
        assembled.resize(frame.size());
        std::copy(frame.begin() + kFrameHeaderSize, frame.end(), assembled.begin() + kFrameHeaderSize);
        const auto whole = try_decode_frame(assembled);
        assert(whole && whole->message == message);

        auto garbled = frame;
        garbled[kFrameHeaderSize] = '{';
        garbled[kFrameHeaderSize + 1] = '{';
        bool threw = false;
        try
        {
            try_decode_frame(garbled);
        }
        catch (const nlohmann::json::parse_error &)
        {
            threw = true;
        }
        assert(threw);

        const std::array<std::uint8_t, kFrameHeaderSize> header{0x00, 0x01, 0x00, 0x02};
        assert(read_frame_length(header) == 65538u);
    }

    void test_base64()
    {
        const auto as_bytes = [](std::string_view text)
        {
            std::vector<std::byte> bytes;
            for (const auto ch : text)
            {
                bytes.push_back(static_cast<std::byte>(ch));
            }
            return bytes;
        };

        assert(encoding::encode_base64(as_bytes("")).empty());
        assert(encoding::encode_base64(as_bytes("f")) == "Zg==");
        assert(encoding::encode_base64(as_bytes("foob")) == "Zm9vYg==");
        assert(encoding::encode_base64(as_bytes("foobar")) == "Zm9vYmFy");

        const auto decoded = encoding::decode_base64("Zm9v\nYmFy");
        assert(decoded);
        assert(*decoded == as_bytes("foobar"));
        assert(!encoding::decode_base64("Zm9v*mFy"));

        const auto padded = encoding::decode_base64("Zg==\n");
        assert(padded);
        assert(*padded == as_bytes("f"));
        assert(!encoding::decode_base64("QQ==QUFB"));
        assert(!encoding::decode_base64("Zg=a"));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::PeerDisconnected) == "peer_disconnected");
        assert(to_string(ErrorCode::RecoveryExhausted) == "recovery_exhausted");
        assert(to_string(ErrorCode::UnknownTransfer) == "unknown_transfer");
        assert(to_string(ErrorCode::InvalidState) == "invalid_state");
        assert(to_string(ErrorCode::Cancelled) == "cancelled");
        assert(to_string(static_cast<ErrorCode>(999)) == "unknown");
    }

    void test_crypto()
    {
        crypto::ensure_sodium_init();
        const auto token = crypto::random_token(32);
        assert(token.size() == 32);
        assert(std::all_of(token.begin(), token.end(), [](char ch)
                           { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z'); }));

        const auto first = crypto::generate_device_id();
        const auto second = crypto::generate_device_id();
        assert(first.size() == 6);
        assert(second.size() == 6);
    }

} // namespace

int main()
{
    spdlog::set_level(spdlog::level::warn);
    try
    {
        test_transfer_request_parsing();
        test_response_and_ack_parsing();
        test_file_chunk_payloads();
        test_resume_parsing();
        test_rejected_messages();
        test_outbound_messages();
        test_framing();
        test_base64();
        test_error_codes();
        test_crypto();
        run_server_component_tests();
        run_relay_scenario_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
