#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "token_codec.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace sharecost
{

    struct ServerConfig
    {
        std::string bind_address{"0.0.0.0"};
        std::uint16_t port{8000};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
    };

    struct AuthConfig
    {
        std::optional<crypto::Bytes> signing_key; // from file or env
        int64_t token_ttl_days{3650};
    };

    enum class StorageBackend
    {
        Memory,
        RocksDb
    };

    struct StorageConfig
    {
        StorageBackend backend{StorageBackend::Memory};
        std::string rocksdb_path{"./data/rocksdb"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
    };

    struct AppConfig
    {
        ServerConfig server{};
        AuthConfig auth{};
        StorageConfig storage{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     *
     *   [server]  bind_address, port, threads
     *   [auth]    signing_key (base64), token_ttl_days
     *   [storage] backend ("memory" | "rocksdb"), rocksdb_path
     *   [logging] level, pattern
     *
     * Environment: SHARECOST_BIND_ADDRESS, SHARECOST_PORT, SHARECOST_THREADS,
     * SHARECOST_SIGNING_KEY (base64), JWT_SECRET (raw secret),
     * SHARECOST_TOKEN_TTL_DAYS, SHARECOST_STORAGE_BACKEND, SHARECOST_ROCKSDB_PATH,
     * SHARECOST_LOG_LEVEL.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AppConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for running without a file */
        static Result<AppConfig> from_env();

        /** Serialize config to JSON for inspection; secrets are reduced to a fingerprint */
        static nlohmann::json to_json(const AppConfig &cfg);

        /** Token codec settings; ConfigError when no signing key is configured */
        static Result<TokenConfig> token_config(const AppConfig &cfg);

    private:
        static Result<void> apply_env_overrides(AppConfig &cfg);
    };

    std::string_view storage_backend_name(StorageBackend backend);

} // namespace sharecost
