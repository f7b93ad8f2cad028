#include <catch2/catch_test_macros.hpp>
#include "sharecost/token_codec.hpp"
#include "sharecost/crypto.hpp"
#include <nlohmann/json.hpp>

using namespace sharecost;

namespace
{
    const std::string kGroup = "3f2b8c1e-9d4a-4e6b-8f1a-2c3d4e5f6a7b";

    TokenConfig test_config(const std::string &secret = "unit-test-signing-key-0123456789abcdef")
    {
        TokenConfig cfg;
        cfg.signing_key = crypto::to_bytes(secret);
        return cfg;
    }

    int64_t in_one_hour()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count() +
               3600;
    }

    // Build an HS256 token from an arbitrary payload, as an older issuer would have
    std::string sign_raw(const TokenConfig &cfg, const std::string &header, const std::string &payload)
    {
        std::string input = crypto::Base64::encode_url_safe(crypto::to_bytes(header)) + "." +
                            crypto::Base64::encode_url_safe(crypto::to_bytes(payload));
        auto tag = crypto::HmacSha256::sign(cfg.signing_key, input);
        return input + "." + crypto::Base64::encode_url_safe(crypto::Bytes(tag.begin(), tag.end()));
    }

    nlohmann::json payload_of(const std::string &token)
    {
        auto first = token.find('.');
        auto second = token.find('.', first + 1);
        auto raw = crypto::Base64::decode_url_safe(token.substr(first + 1, second - first - 1));
        REQUIRE(raw.has_value());
        return nlohmann::json::parse(raw->begin(), raw->end());
    }
}

TEST_CASE("Issued token verifies with its claims", "[token_codec]")
{
    TokenCodec codec(test_config());
    CapabilitySet caps(true, false, true, std::nullopt, false);

    auto token = codec.issue(kGroup, caps);
    REQUIRE(token.has_value());

    auto claims = codec.verify(*token);
    REQUIRE(claims.has_value());
    REQUIRE(claims->group_id == kGroup);
    REQUIRE(claims->capabilities.has_value());
    REQUIRE(*claims->capabilities == caps);
    REQUIRE_FALSE(claims->capabilities->raw(Capability::AddExpenses).has_value());
}

TEST_CASE("Encoder emits compact field names", "[token_codec]")
{
    TokenCodec codec(test_config());
    auto token = codec.issue(kGroup, CapabilitySet(std::nullopt, false, std::nullopt, std::nullopt, std::nullopt));
    REQUIRE(token.has_value());

    auto payload = payload_of(*token);
    REQUIRE(payload["gid"] == kGroup);
    REQUIRE(payload["exp"].is_number_integer());
    REQUIRE(payload["cap"] == nlohmann::json{{"mm", false}});
    REQUIRE_FALSE(payload.contains("group_id"));
}

TEST_CASE("Token without capability set stays unset", "[token_codec]")
{
    TokenCodec codec(test_config());
    auto token = codec.issue(kGroup, std::nullopt);
    REQUIRE(token.has_value());
    REQUIRE_FALSE(payload_of(*token).contains("cap"));

    auto claims = codec.verify(*token);
    REQUIRE(claims.has_value());
    REQUIRE_FALSE(claims->capabilities.has_value());
}

TEST_CASE("Lifetime sets the expiry", "[token_codec]")
{
    auto cfg = test_config();
    cfg.lifetime = std::chrono::hours(24);
    TokenCodec codec(cfg);
    auto claims = codec.verify(*codec.issue(kGroup, std::nullopt));
    REQUIRE(claims.has_value());
    auto delta = claims->expires_at - (in_one_hour() - 3600);
    REQUIRE(delta > 86400 - 60);
    REQUIRE(delta <= 86400);
}

TEST_CASE("Legacy payload fixture still decodes", "[token_codec]")
{
    auto cfg = test_config();
    TokenCodec codec(cfg);

    nlohmann::json payload = {{"group_id", kGroup},
                              {"exp", in_one_hour()},
                              {"permissions", {{"can_delete_group", false}, {"can_add_expenses", true}}}};
    auto token = sign_raw(cfg, R"({"typ":"JWT","alg":"HS256"})", payload.dump());

    auto claims = codec.verify(token);
    REQUIRE(claims.has_value());
    REQUIRE(claims->group_id == kGroup);
    REQUIRE(claims->capabilities.has_value());
    REQUIRE_FALSE(claims->capabilities->has_delete_group());
    REQUIRE(claims->capabilities->has_add_expenses());
    REQUIRE(claims->capabilities->has_manage_members());
}

TEST_CASE("Legacy payload without capabilities decodes as unset", "[token_codec]")
{
    auto cfg = test_config();
    TokenCodec codec(cfg);
    nlohmann::json payload = {{"group_id", kGroup}, {"exp", in_one_hour()}};
    auto claims = codec.verify(sign_raw(cfg, R"({"alg":"HS256","typ":"JWT"})", payload.dump()));
    REQUIRE(claims.has_value());
    REQUIRE_FALSE(claims->capabilities.has_value());
}

TEST_CASE("Tampered payload is a signature mismatch", "[token_codec]")
{
    TokenCodec codec(test_config());
    auto token = *codec.issue(kGroup, CapabilitySet::none());

    auto first = token.find('.');
    auto second = token.find('.', first + 1);
    nlohmann::json forged = {{"gid", kGroup}, {"exp", in_one_hour()}, {"cap", CapabilitySet::all().to_json()}};
    auto tampered = token.substr(0, first + 1) +
                    crypto::Base64::encode_url_safe(crypto::to_bytes(forged.dump())) +
                    token.substr(second);

    auto result = codec.verify(tampered);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TokenSignatureMismatch);
}

TEST_CASE("Token from another key is rejected", "[token_codec]")
{
    TokenCodec issuer(test_config("issuer-key-aaaaaaaaaaaaaaaaaaaaaaaaaaaaa"));
    TokenCodec verifier(test_config("verifier-key-bbbbbbbbbbbbbbbbbbbbbbbbbbb"));
    auto result = verifier.verify(*issuer.issue(kGroup, std::nullopt));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TokenSignatureMismatch);
}

TEST_CASE("Expired token is rejected", "[token_codec]")
{
    TokenCodec codec(test_config());
    TokenClaims claims{kGroup, in_one_hour() - 7200, std::nullopt};
    auto token = codec.encode(claims);
    REQUIRE(token.has_value());

    auto result = codec.verify(*token);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TokenExpired);
}

TEST_CASE("Garbage is malformed", "[token_codec]")
{
    TokenCodec codec(test_config());
    for (std::string bad : {"", "abc", "a.b", "a.b.c.d", "!!!.???.***"})
    {
        auto result = codec.verify(bad);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_token_failure());
    }

    std::string huge(TokenCodec::kMaxTokenSize + 1, 'a');
    auto result = codec.verify(huge);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TokenMalformed);
}

TEST_CASE("Signed but structurally invalid payloads are malformed", "[token_codec]")
{
    auto cfg = test_config();
    TokenCodec codec(cfg);
    const std::string header = R"({"alg":"HS256","typ":"JWT"})";

    auto not_json = codec.verify(sign_raw(cfg, header, "not json"));
    REQUIRE(not_json.error().code == ErrorCode::TokenMalformed);

    auto no_group = codec.verify(sign_raw(cfg, header, nlohmann::json{{"exp", in_one_hour()}}.dump()));
    REQUIRE(no_group.error().code == ErrorCode::TokenMalformed);

    auto bad_group = codec.verify(sign_raw(cfg, header, nlohmann::json{{"gid", "42"}, {"exp", in_one_hour()}}.dump()));
    REQUIRE(bad_group.error().code == ErrorCode::TokenMalformed);

    auto no_exp = codec.verify(sign_raw(cfg, header, nlohmann::json{{"gid", kGroup}}.dump()));
    REQUIRE(no_exp.error().code == ErrorCode::TokenMalformed);

    auto bad_flag = codec.verify(sign_raw(cfg, header,
                                          nlohmann::json{{"gid", kGroup}, {"exp", in_one_hour()}, {"cap", {{"dg", 1}}}}.dump()));
    REQUIRE(bad_flag.error().code == ErrorCode::TokenMalformed);

    auto wrong_alg = codec.verify(sign_raw(cfg, R"({"alg":"none"})",
                                           nlohmann::json{{"gid", kGroup}, {"exp", in_one_hour()}}.dump()));
    REQUIRE(wrong_alg.error().code == ErrorCode::TokenMalformed);
}

TEST_CASE("Invalid group id cannot be issued", "[token_codec]")
{
    TokenCodec codec(test_config());
    auto token = codec.issue("not-a-uuid", std::nullopt);
    REQUIRE_FALSE(token.has_value());
    REQUIRE(token.error().code == ErrorCode::ValidationError);
}

TEST_CASE("Empty signing key is a configuration error", "[token_codec]")
{
    TokenConfig cfg;
    REQUIRE_THROWS_AS(TokenCodec(cfg), SharecostError);
}

TEST_CASE("Key fingerprint does not reveal the key", "[token_codec]")
{
    TokenCodec codec(test_config());
    auto fp = codec.key_fingerprint();
    REQUIRE(fp.size() == 12);
    REQUIRE(fp.find("unit") == std::string::npos);
}
