#include "bucketsync/crypto.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace bucketsync::crypto
{

    namespace
    {

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

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string sha256_hex(std::string_view data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string sha256_stream(std::istream &input)
    {
        ensure_initialized_once();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }

        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                if (crypto_hash_sha256_update(&state, buffer.data(), read_count) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_update failed");
                }
            }
        }

        std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256_final(&state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(digest);
    }

    std::string hmac_sha256(std::string_view key, std::string_view data)
    {
        ensure_initialized_once();
        crypto_auth_hmacsha256_state state;
        if (crypto_auth_hmacsha256_init(&state, reinterpret_cast<const unsigned char *>(key.data()), key.size()) != 0 ||
            crypto_auth_hmacsha256_update(&state, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256 failed");
        }
        std::string mac(crypto_auth_hmacsha256_BYTES, '\0');
        if (crypto_auth_hmacsha256_final(&state, reinterpret_cast<unsigned char *>(mac.data())) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256_final failed");
        }
        return mac;
    }

    std::string hmac_sha256_hex(std::string_view key, std::string_view data)
    {
        const auto mac = hmac_sha256(key, data);
        return to_hex(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(mac.data()), mac.size()));
    }

} // namespace bucketsync::crypto
