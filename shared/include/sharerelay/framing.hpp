/**
 * ShareRelay - Length-prefixed JSON framing used by the TCP transport.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace sharerelay::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    // Returns nullopt while the buffer holds less than one complete frame.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace sharerelay::protocol
