#include "sharerelay/error_codes.hpp"

#include <array>

namespace sharerelay
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidMessage, "invalid_message"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::UnknownDevice, "unknown_device"},
            {ErrorCode::UnknownTransfer, "unknown_transfer"},
            {ErrorCode::InvalidChunkIndex, "invalid_chunk_index"},
            {ErrorCode::DuplicateTransfer, "duplicate_transfer"},
            {ErrorCode::InvalidState, "invalid_state"},
            {ErrorCode::PeerUnavailable, "peer_unavailable"},
            {ErrorCode::PeerDisconnected, "peer_disconnected"},
            {ErrorCode::RecoveryExhausted, "recovery_exhausted"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::Unsupported, "unsupported"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace sharerelay
