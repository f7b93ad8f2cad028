#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sharecost::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using HmacTag = std::array<uint8_t, 32>;

    /**
     * Convert a string to bytes (no encoding applied)
     */
    inline Bytes to_bytes(std::string_view s)
    {
        return Bytes(s.begin(), s.end());
    }

    /**
     * HMAC-SHA-256 over arbitrary-length keys (libsodium crypto_auth_hmacsha256)
     */
    class HmacSha256
    {
    public:
        /**
         * Compute the 32-byte tag of message under key
         */
        static HmacTag sign(const Bytes &key, std::string_view message);

        /**
         * Recompute the tag and compare in constant time
         */
        static bool verify(const Bytes &key, std::string_view message, const Bytes &tag);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        /**
         * Convert hash to hex string
         */
        static std::string to_hex(const SHA256Hash &hash);

        /**
         * Short hex fingerprint of a secret, safe to log
         */
        static std::string fingerprint(const Bytes &secret);
    };

    /**
     * Base64 encoding/decoding
     */
    class Base64
    {
    public:
        /**
         * Decode base64 string to bytes (standard alphabet)
         */
        static Result<Bytes> decode(const std::string &encoded);

        /**
         * Encode to URL-safe base64 (no padding)
         */
        static std::string encode_url_safe(const Bytes &data);

        /**
         * Decode URL-safe base64 (no padding)
         */
        static Result<Bytes> decode_url_safe(std::string_view encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        /**
         * Generate N random bytes
         */
        static Bytes generate_bytes(size_t n);
    };

    /**
     * Constant-time comparison; false when sizes differ
     */
    bool constant_time_equal(const Bytes &a, const Bytes &b);

} // namespace sharecost::crypto
