#pragma once

#include "types.hpp"
#include "capability.hpp"
#include "token_codec.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sharecost
{

    /** Authenticated bearer of a group token */
    struct Principal
    {
        GroupId group_id;
        CapabilitySet capabilities; // resolved, never unset
    };

    /** A freshly minted token and the rights it grants */
    struct IssuedToken
    {
        std::string token;
        CapabilitySet capabilities;

        nlohmann::json to_json() const;
    };

    /**
     * Turns inbound credentials into principals and mints derived tokens.
     *
     * Authorization is per operation: each mutating operation calls require()
     * with the one capability it needs before touching the store.
     */
    class CapabilityAuthority
    {
    public:
        /** The codec must outlive the authority */
        explicit CapabilityAuthority(const TokenCodec &codec);

        /**
         * Authenticate the value of an Authorization header.
         * Absent or empty -> AuthMissing; anything but a verifiable
         * "Bearer <token>" -> AuthInvalid.
         */
        Result<Principal> authenticate(const std::optional<std::string_view> &authorization) const;

        /** Verify a raw token; codec failures are reported as AuthInvalid */
        Result<TokenClaims> verify_token(std::string_view token) const;

        /** Effective capabilities: the token's set, or all() for legacy tokens */
        static CapabilitySet resolve_capabilities(const TokenClaims &claims);

        /** AuthForbidden unless the principal holds cap */
        static Result<void> require(const Principal &principal, Capability cap);

        Result<std::string> issue_token(const GroupId &group_id,
                                        const std::optional<CapabilitySet> &capabilities) const;

        /**
         * Mint a share link for the principal's group. The requested set is
         * attenuated by the principal's own rights.
         */
        Result<IssuedToken> mint_share_link(const Principal &principal, const CapabilitySet &requested) const;

        /**
         * Combine the principal's token with another token of the same group.
         * The new token carries the union of both sets. The other token is
         * verified once, here.
         */
        Result<IssuedToken> merge(const Principal &principal, std::string_view other_token) const;

    private:
        const TokenCodec &codec_;
    };

} // namespace sharecost
