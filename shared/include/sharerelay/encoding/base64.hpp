#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sharerelay::encoding
{

    // Standard alphabet with '=' padding.
    std::string encode_base64(std::span<const std::byte> data);

    // Whitespace is skipped; any other character outside the alphabet yields nullopt.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace sharerelay::encoding
