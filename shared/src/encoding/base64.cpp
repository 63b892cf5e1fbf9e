#include "sharerelay/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace sharerelay::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int pending_bits = 0;
        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            pending_bits += 8;
            while (pending_bits >= 6)
            {
                pending_bits -= 6;
                output.push_back(kAlphabet[(buffer >> pending_bits) & 0x3Fu]);
            }
        }

        if (pending_bits > 0)
        {
            output.push_back(kAlphabet[(buffer << (6 - pending_bits)) & 0x3Fu]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int pending_bits = 0;
        bool padded = false;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            const auto value = kDecodeTable[c];
            if (value == kPadding)
            {
                padded = true;
                continue;
            }
            // Only more padding or whitespace may follow the first '='.
            if (padded && !std::isspace(c))
            {
                return std::nullopt;
            }
            if (value == kInvalid)
            {
                if (std::isspace(c))
                {
                    continue;
                }
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            pending_bits += 6;
            if (pending_bits >= 8)
            {
                pending_bits -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> pending_bits) & 0xFFu));
            }
        }
        return output;
    }

} // namespace sharerelay::encoding
