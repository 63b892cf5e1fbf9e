/**
 * ShareRelay - Error codes reported to devices in transfer-error and transfer-failed messages.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace sharerelay
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidMessage = 1,
        InvalidPayload = 2,
        UnknownDevice = 3,
        UnknownTransfer = 4,
        InvalidChunkIndex = 5,
        DuplicateTransfer = 6,
        InvalidState = 7,
        PeerUnavailable = 8,
        PeerDisconnected = 9,
        RecoveryExhausted = 10,
        Cancelled = 11,
        Unsupported = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace sharerelay
