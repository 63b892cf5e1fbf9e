#include "sharerelay/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace sharerelay::protocol
{

    namespace
    {
        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kFrameHeaderSize> header)
        {
            header[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            header[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            header[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            header[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept
    {
        return (static_cast<std::uint32_t>(header[0]) << 24) |
               (static_cast<std::uint32_t>(header[1]) << 16) |
               (static_cast<std::uint32_t>(header[2]) << 8) |
               static_cast<std::uint32_t>(header[3]);
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_frame_length(buffer.first<kFrameHeaderSize>());
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        DecodedFrame result{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

} // namespace sharerelay::protocol
