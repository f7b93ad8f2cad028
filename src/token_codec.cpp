#include "sharecost/token_codec.hpp"
#include <nlohmann/json.hpp>
#include <format>
#include <initializer_list>

using json = nlohmann::json;

namespace sharecost
{

    namespace
    {
        constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";

        int64_t unix_now()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        Result<json> decode_segment(std::string_view segment, std::string_view what)
        {
            auto raw = crypto::Base64::decode_url_safe(segment);
            if (!raw)
                return std::unexpected(SharecostError::token_malformed(std::format("{} is not base64url", what)));
            try
            {
                auto j = json::parse(raw->begin(), raw->end());
                if (!j.is_object())
                    return std::unexpected(SharecostError::token_malformed(std::format("{} is not a JSON object", what)));
                return j;
            }
            catch (const json::exception &e)
            {
                return std::unexpected(SharecostError::token_malformed(std::format("{} is not JSON: {}", what, e.what())));
            }
        }

        // First present, non-null member among the given spellings
        const json *find_any(const json &obj, std::initializer_list<const char *> keys)
        {
            for (const char *key : keys)
            {
                auto it = obj.find(key);
                if (it != obj.end() && !it->is_null())
                    return &*it;
            }
            return nullptr;
        }

        Result<TokenClaims> claims_from_payload(const json &payload)
        {
            TokenClaims claims;

            const json *gid = find_any(payload, {"gid", "group_id"});
            if (!gid || !gid->is_string())
                return std::unexpected(SharecostError::token_malformed("token carries no group id"));
            auto group_id = parse_uuid(gid->get<std::string>(), "group");
            if (!group_id)
                return std::unexpected(SharecostError::token_malformed(group_id.error().what()));
            claims.group_id = *group_id;

            const json *exp = find_any(payload, {"exp"});
            if (!exp || !(exp->is_number_integer() || exp->is_number_unsigned()))
                return std::unexpected(SharecostError::token_malformed("token carries no integer expiry"));
            claims.expires_at = exp->get<int64_t>();

            if (const json *cap = find_any(payload, {"cap", "permissions", "capabilities"}))
            {
                auto caps = CapabilitySet::from_json(*cap);
                if (!caps)
                    return std::unexpected(caps.error());
                claims.capabilities = *caps;
            }
            return claims;
        }
    } // namespace

    TokenCodec::TokenCodec(TokenConfig cfg) : cfg_(std::move(cfg))
    {
        if (cfg_.signing_key.empty())
        {
            throw SharecostError::config("token signing key must not be empty");
        }
    }

    Result<std::string> TokenCodec::issue(const GroupId &group_id,
                                          const std::optional<CapabilitySet> &capabilities) const
    {
        TokenClaims claims{group_id, unix_now() + cfg_.lifetime.count(), capabilities};
        return encode(claims);
    }

    Result<std::string> TokenCodec::encode(const TokenClaims &claims) const
    {
        if (!is_uuid(claims.group_id))
        {
            return std::unexpected(SharecostError::validation(
                std::format("cannot issue token for invalid group id '{}'", claims.group_id)));
        }

        json payload = {{"gid", claims.group_id}, {"exp", claims.expires_at}};
        if (claims.capabilities)
            payload["cap"] = claims.capabilities->to_json();

        std::string signing_input = crypto::Base64::encode_url_safe(crypto::to_bytes(kHeader)) + "." +
                                    crypto::Base64::encode_url_safe(crypto::to_bytes(payload.dump()));
        auto tag = crypto::HmacSha256::sign(cfg_.signing_key, signing_input);
        return signing_input + "." + crypto::Base64::encode_url_safe(crypto::Bytes(tag.begin(), tag.end()));
    }

    Result<TokenClaims> TokenCodec::verify(std::string_view token) const
    {
        if (token.empty() || token.size() > kMaxTokenSize)
            return std::unexpected(SharecostError::token_malformed("token is empty or too large"));

        auto p1 = token.find('.');
        auto p2 = p1 == std::string_view::npos ? p1 : token.find('.', p1 + 1);
        if (p2 == std::string_view::npos || token.find('.', p2 + 1) != std::string_view::npos)
            return std::unexpected(SharecostError::token_malformed("token must have three segments"));

        auto signing_input = token.substr(0, p2);
        auto sig = crypto::Base64::decode_url_safe(token.substr(p2 + 1));
        if (!sig)
            return std::unexpected(SharecostError::token_malformed("signature is not base64url"));

        // Nothing in the token is interpreted before the signature checks out
        if (!crypto::HmacSha256::verify(cfg_.signing_key, signing_input, *sig))
            return std::unexpected(SharecostError::signature_mismatch("token signature mismatch"));

        auto header = decode_segment(token.substr(0, p1), "header");
        if (!header)
            return std::unexpected(header.error());
        auto alg = header->find("alg");
        if (alg == header->end() || !alg->is_string() || alg->get<std::string>() != "HS256")
            return std::unexpected(SharecostError::token_malformed("unsupported token algorithm"));

        auto payload = decode_segment(token.substr(p1 + 1, p2 - p1 - 1), "payload");
        if (!payload)
            return std::unexpected(payload.error());

        auto claims = claims_from_payload(*payload);
        if (!claims)
            return std::unexpected(claims.error());

        if (claims->expires_at <= unix_now())
            return std::unexpected(SharecostError::token_expired("token expired"));

        return claims;
    }

    std::string TokenCodec::key_fingerprint() const
    {
        return crypto::SHA256::fingerprint(cfg_.signing_key);
    }

} // namespace sharecost
