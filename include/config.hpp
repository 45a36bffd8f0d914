#pragma once

#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Process configuration loaded from a JSON file.
 * Load-once at startup, immutable thereafter.
 *
 * Environment overrides, applied after the file:
 *   JWT_SECRET_KEY  -> tokens.secret
 *   ENVIRONMENT     -> environment
 */
class Config
{
public:
    static constexpr std::string_view insecure_default_secret = "INSECURE_DEFAULT_CHANGE_IN_PRODUCTION";

    struct StorageCfg
    {
        std::string db_path = "warden.db";
    };

    struct TokensCfg
    {
        std::string secret{insecure_default_secret};
        std::chrono::minutes access_ttl{120};
        std::chrono::days refresh_ttl{7};
    };

    struct LockoutCfg
    {
        uint32_t max_attempts = 5;
        std::chrono::minutes window{60};
        std::chrono::minutes lockout{15};
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static std::expected<Config, std::string> from_string(std::string_view text);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const std::string& environment() const { return env; }
    [[nodiscard]] bool is_production() const { return env == "production"; }
    [[nodiscard]] const StorageCfg& storage() const { return store; }
    [[nodiscard]] const TokensCfg& tokens() const { return tok; }
    [[nodiscard]] const LockoutCfg& lockout() const { return lock; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    std::string env = "development";
    StorageCfg store;
    TokensCfg tok;
    LockoutCfg lock;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
    void apply_env_overrides();
};
