#include "sharecost/crypto.hpp"
#include <sodium.h>
#include <cstring>
#include <format>

namespace sharecost::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    HmacTag HmacSha256::sign(const Bytes &key, std::string_view message)
    {
        HmacTag tag;
        crypto_auth_hmacsha256_state state;

        // The _init variant accepts keys of any length, as HS256 requires
        crypto_auth_hmacsha256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const unsigned char *>(message.data()),
                                      message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());
        sodium_memzero(&state, sizeof(state));

        return tag;
    }

    bool HmacSha256::verify(const Bytes &key, std::string_view message, const Bytes &tag)
    {
        auto expected = sign(key, message);
        return constant_time_equal(Bytes(expected.begin(), expected.end()), tag);
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex;
        hex.reserve(64);
        for (uint8_t byte : hash)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    std::string SHA256::fingerprint(const Bytes &secret)
    {
        return to_hex(hash(secret)).substr(0, 12);
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(SharecostError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_URLSAFE_NO_PADDING);

        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode_url_safe(std::string_view encoded)
    {
        Bytes decoded(encoded.size() + 1);
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.data(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
        {
            return std::unexpected(SharecostError::crypto("Invalid base64url encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    bool constant_time_equal(const Bytes &a, const Bytes &b)
    {
        if (a.size() != b.size())
            return false;
        if (a.empty())
            return true;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

} // namespace sharecost::crypto
