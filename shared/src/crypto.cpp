#include "sharerelay/crypto.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace sharerelay::crypto
{

    namespace
    {

        constexpr std::string_view kTokenAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
        constexpr std::size_t kDeviceIdLength = 6;

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    std::string random_token(std::size_t length)
    {
        ensure_sodium_init();
        std::string token;
        token.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
        {
            const auto index = randombytes_uniform(static_cast<std::uint32_t>(kTokenAlphabet.size()));
            token.push_back(kTokenAlphabet[index]);
        }
        return token;
    }

    std::string generate_device_id()
    {
        return random_token(kDeviceIdLength);
    }

} // namespace sharerelay::crypto
