#include "sharecost/config.hpp"
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace sharecost
{
    namespace
    {
        Result<StorageBackend> parse_backend(std::string_view name)
        {
            if (name == "memory")
                return StorageBackend::Memory;
            if (name == "rocksdb")
                return StorageBackend::RocksDb;
            return std::unexpected(SharecostError::config(std::format("unknown storage backend '{}'", name)));
        }

        Result<crypto::Bytes> decode_key(const std::string &b64, std::string_view source)
        {
            auto decoded = crypto::Base64::decode(b64);
            if (!decoded || decoded->empty())
                return std::unexpected(SharecostError::config(std::format("{}: signing key is not valid base64", source)));
            if (decoded->size() < 32)
                return std::unexpected(SharecostError::config(std::format("{}: signing key must be at least 32 bytes", source)));
            return *decoded;
        }

        template <typename T>
        Result<T> parse_number(std::string_view text, std::string_view var)
        {
            T value{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size())
                return std::unexpected(SharecostError::config(std::format("{} must be a number, got '{}'", var, text)));
            return value;
        }

        // Range checks shared by the file and the environment; `source` names the setting
        Result<std::uint16_t> checked_port(int64_t port, std::string_view source)
        {
            if (port <= 0 || port > 65535)
                return std::unexpected(SharecostError::config(std::format("{} out of range", source)));
            return static_cast<std::uint16_t>(port);
        }

        Result<std::size_t> checked_threads(int64_t threads, std::string_view source)
        {
            if (threads <= 0)
                return std::unexpected(SharecostError::config(std::format("{} must be positive", source)));
            return static_cast<std::size_t>(threads);
        }

        Result<int64_t> checked_ttl_days(int64_t days, std::string_view source)
        {
            if (days <= 0)
                return std::unexpected(SharecostError::config(std::format("{} must be positive", source)));
            return days;
        }

        Result<void> parse_toml(const toml::table &tbl, AppConfig &cfg)
        {
            if (auto server = tbl["server"].as_table())
            {
                if (auto addr = (*server)["bind_address"].value<std::string>())
                    cfg.server.bind_address = *addr;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    auto checked = checked_port(*port, "server.port");
                    if (!checked)
                        return std::unexpected(checked.error());
                    cfg.server.port = *checked;
                }
                if (auto threads = (*server)["threads"].value<int64_t>())
                {
                    auto checked = checked_threads(*threads, "server.threads");
                    if (!checked)
                        return std::unexpected(checked.error());
                    cfg.server.threads = *checked;
                }
            }

            if (auto auth = tbl["auth"].as_table())
            {
                if (auto key = (*auth)["signing_key"].value<std::string>())
                {
                    auto decoded = decode_key(*key, "auth.signing_key");
                    if (!decoded)
                        return std::unexpected(decoded.error());
                    cfg.auth.signing_key = *decoded;
                }
                if (auto ttl = (*auth)["token_ttl_days"].value<int64_t>())
                {
                    auto checked = checked_ttl_days(*ttl, "auth.token_ttl_days");
                    if (!checked)
                        return std::unexpected(checked.error());
                    cfg.auth.token_ttl_days = *checked;
                }
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto backend = (*storage)["backend"].value<std::string>())
                {
                    auto parsed = parse_backend(*backend);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.storage.backend = *parsed;
                }
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto pattern = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *pattern;
            }

            return {};
        }

    } // namespace

    std::string_view storage_backend_name(StorageBackend backend)
    {
        switch (backend)
        {
        case StorageBackend::Memory:
            return "memory";
        case StorageBackend::RocksDb:
            return "rocksdb";
        }
        return "unknown";
    }

    Result<AppConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(SharecostError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(SharecostError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<AppConfig> ConfigLoader::from_env()
    {
        AppConfig cfg{};
        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AppConfig &cfg)
    {
        if (const char *addr = std::getenv("SHARECOST_BIND_ADDRESS"))
            cfg.server.bind_address = addr;
        if (const char *port = std::getenv("SHARECOST_PORT"))
        {
            auto parsed = parse_number<int64_t>(port, "SHARECOST_PORT");
            if (!parsed)
                return std::unexpected(parsed.error());
            auto checked = checked_port(*parsed, "SHARECOST_PORT");
            if (!checked)
                return std::unexpected(checked.error());
            cfg.server.port = *checked;
        }
        if (const char *threads = std::getenv("SHARECOST_THREADS"))
        {
            auto parsed = parse_number<int64_t>(threads, "SHARECOST_THREADS");
            if (!parsed)
                return std::unexpected(parsed.error());
            auto checked = checked_threads(*parsed, "SHARECOST_THREADS");
            if (!checked)
                return std::unexpected(checked.error());
            cfg.server.threads = *checked;
        }

        // The raw secret is the name older deployments set; the base64 key wins
        if (const char *secret = std::getenv("JWT_SECRET"); secret && *secret)
            cfg.auth.signing_key = crypto::to_bytes(secret);
        if (const char *key = std::getenv("SHARECOST_SIGNING_KEY"))
        {
            auto decoded = decode_key(key, "SHARECOST_SIGNING_KEY");
            if (!decoded)
                return std::unexpected(decoded.error());
            cfg.auth.signing_key = *decoded;
        }
        if (const char *ttl = std::getenv("SHARECOST_TOKEN_TTL_DAYS"))
        {
            auto parsed = parse_number<int64_t>(ttl, "SHARECOST_TOKEN_TTL_DAYS");
            if (!parsed)
                return std::unexpected(parsed.error());
            auto checked = checked_ttl_days(*parsed, "SHARECOST_TOKEN_TTL_DAYS");
            if (!checked)
                return std::unexpected(checked.error());
            cfg.auth.token_ttl_days = *checked;
        }

        if (const char *backend = std::getenv("SHARECOST_STORAGE_BACKEND"))
        {
            auto parsed = parse_backend(backend);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.storage.backend = *parsed;
        }
        if (const char *path = std::getenv("SHARECOST_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;

        if (const char *level = std::getenv("SHARECOST_LOG_LEVEL"))
            cfg.logging.level = level;

        return {};
    }

    Result<TokenConfig> ConfigLoader::token_config(const AppConfig &cfg)
    {
        if (!cfg.auth.signing_key || cfg.auth.signing_key->empty())
        {
            return std::unexpected(SharecostError::config(
                "no signing key configured (auth.signing_key, SHARECOST_SIGNING_KEY or JWT_SECRET)"));
        }
        if (cfg.auth.token_ttl_days <= 0)
        {
            return std::unexpected(SharecostError::config("token lifetime must be positive"));
        }
        TokenConfig tc;
        tc.signing_key = *cfg.auth.signing_key;
        tc.lifetime = std::chrono::hours(24 * cfg.auth.token_ttl_days);
        return tc;
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {{"bind_address", cfg.server.bind_address},
                       {"port", cfg.server.port},
                       {"threads", cfg.server.threads}};
        j["auth"] = {{"token_ttl_days", cfg.auth.token_ttl_days},
                     {"has_signing_key", cfg.auth.signing_key.has_value()}};
        if (cfg.auth.signing_key)
            j["auth"]["key_fingerprint"] = crypto::SHA256::fingerprint(*cfg.auth.signing_key);
        j["storage"] = {{"backend", std::string(storage_backend_name(cfg.storage.backend))},
                        {"rocksdb_path", cfg.storage.rocksdb_path}};
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        return j;
    }

} // namespace sharecost
