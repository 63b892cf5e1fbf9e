/**
 * ShareRelay - Randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>

namespace sharerelay::crypto
{

    void ensure_sodium_init();

    // Lowercase alphanumeric token drawn uniformly with randombytes_uniform.
    std::string random_token(std::size_t length);

    std::string generate_device_id();

} // namespace sharerelay::crypto
