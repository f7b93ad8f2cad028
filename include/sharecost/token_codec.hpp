#pragma once

#include "types.hpp"
#include "capability.hpp"
#include "crypto.hpp"
#include "models.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sharecost
{

    /**
     * Claims carried by a group token. Never stored server-side: the token is the
     * only record of them.
     */
    struct TokenClaims
    {
        GroupId group_id;
        int64_t expires_at{0}; // unix seconds
        std::optional<CapabilitySet> capabilities; // unset on legacy tokens
    };

    struct TokenConfig
    {
        crypto::Bytes signing_key;
        // Tokens double as shareable links, so they are meant to outlive any session
        std::chrono::seconds lifetime{std::chrono::hours(24 * 3650)};
    };

    /**
     * HS256 JWT codec for group tokens.
     *
     * Emits compact payloads {"gid", "exp", "cap"} and accepts the older long-form
     * names (group_id, permissions/capabilities, can_* flags) so tokens minted
     * under a previous schema keep working. Pure: the only state is the key.
     */
    class TokenCodec
    {
    public:
        /** Throws SharecostError (ConfigError) when the signing key is empty */
        explicit TokenCodec(TokenConfig cfg);

        /** Issue a token for group_id expiring now + lifetime */
        Result<std::string> issue(const GroupId &group_id,
                                  const std::optional<CapabilitySet> &capabilities) const;

        /** Sign explicit claims */
        Result<std::string> encode(const TokenClaims &claims) const;

        /**
         * Verify signature and expiry and decode the claims.
         * Errors: TokenMalformed, TokenSignatureMismatch, TokenExpired.
         */
        Result<TokenClaims> verify(std::string_view token) const;

        /** Hex fingerprint of the signing key, safe to log */
        std::string key_fingerprint() const;

        std::chrono::seconds lifetime() const { return cfg_.lifetime; }

        static constexpr std::size_t kMaxTokenSize = 8 * 1024;

    private:
        TokenConfig cfg_;
    };

} // namespace sharecost
