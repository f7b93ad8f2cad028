#include "sharecost/authority.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace sharecost
{

    namespace
    {
        constexpr std::string_view kBearerPrefix = "Bearer ";
    }

    nlohmann::json IssuedToken::to_json() const
    {
        return nlohmann::json{{"token", token}, {"permissions", capabilities.to_resolved_json()}};
    }

    CapabilityAuthority::CapabilityAuthority(const TokenCodec &codec) : codec_(codec) {}

    Result<Principal> CapabilityAuthority::authenticate(const std::optional<std::string_view> &authorization) const
    {
        if (!authorization || authorization->empty())
        {
            return std::unexpected(SharecostError::auth_missing("missing bearer token"));
        }

        if (!authorization->starts_with(kBearerPrefix))
        {
            return std::unexpected(SharecostError::auth_invalid("authorization is not a bearer token"));
        }

        auto claims = verify_token(authorization->substr(kBearerPrefix.size()));
        if (!claims)
            return std::unexpected(claims.error());

        return Principal{claims->group_id, resolve_capabilities(*claims)};
    }

    Result<TokenClaims> CapabilityAuthority::verify_token(std::string_view token) const
    {
        auto claims = codec_.verify(token);
        if (!claims)
        {
            // The failure kind stays in the log; callers only learn the token is invalid
            spdlog::warn("token rejected ({}): {}", error_code_name(claims.error().code), claims.error().what());
            return std::unexpected(SharecostError::auth_invalid("invalid token"));
        }
        return claims;
    }

    CapabilitySet CapabilityAuthority::resolve_capabilities(const TokenClaims &claims)
    {
        return claims.capabilities.value_or(CapabilitySet::all());
    }

    Result<void> CapabilityAuthority::require(const Principal &principal, Capability cap)
    {
        if (principal.capabilities.has(cap))
            return {};

        spdlog::info("group {}: denied operation requiring {}", principal.group_id, capability_name(cap));
        return std::unexpected(SharecostError::forbidden(
            std::format("token lacks the '{}' capability", capability_name(cap))));
    }

    Result<std::string> CapabilityAuthority::issue_token(const GroupId &group_id,
                                                         const std::optional<CapabilitySet> &capabilities) const
    {
        return codec_.issue(group_id, capabilities);
    }

    Result<IssuedToken> CapabilityAuthority::mint_share_link(const Principal &principal,
                                                             const CapabilitySet &requested) const
    {
        auto granted = requested.cap_by(principal.capabilities);
        spdlog::debug("group {}: share link with {}", principal.group_id, granted.to_json().dump());
        auto token = codec_.issue(principal.group_id, granted);
        if (!token)
            return std::unexpected(token.error());
        return IssuedToken{std::move(*token), granted};
    }

    Result<IssuedToken> CapabilityAuthority::merge(const Principal &principal, std::string_view other_token) const
    {
        auto other = verify_token(other_token);
        if (!other)
            return std::unexpected(other.error());

        if (other->group_id != principal.group_id)
        {
            return std::unexpected(SharecostError::validation("tokens belong to different groups"));
        }

        auto merged = principal.capabilities.union_with(resolve_capabilities(*other));
        auto token = codec_.issue(principal.group_id, merged);
        if (!token)
            return std::unexpected(token.error());
        return IssuedToken{std::move(*token), merged};
    }

} // namespace sharecost
