#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

bool known_environment(std::string_view env)
{
    return env == "development" || env == "staging" || env == "production";
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

std::expected<Config, std::string> Config::from_string(std::string_view text)
{
    json::value jv;
    try
    {
        jv = json::parse(text);
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    auto result = parse(jv);
    if (result)
    {
        result->apply_env_overrides();
    }
    return result;
}

Config Config::load_defaults()
{
    Config cfg{};
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

void Config::apply_env_overrides()
{
    if (const char* secret = std::getenv("JWT_SECRET_KEY"); secret && *secret)
    {
        tok.secret = secret;
    }
    if (const char* e = std::getenv("ENVIRONMENT"); e && known_environment(e))
    {
        env = e;
    }
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    config.env = get_string(root, "environment", "development");
    if (!known_environment(config.env))
    {
        return std::unexpected(std::format("Unknown environment '{}'", config.env));
    }

    if (auto it = root.find("storage"); it != root.end() && it->value().is_object())
    {
        const auto& st = it->value().as_object();
        config.store.db_path = get_string(st, "db_path", "warden.db");
        if (config.store.db_path.empty())
        {
            return std::unexpected("'db_path' must not be empty");
        }
    }
    if (auto it = root.find("tokens"); it != root.end() && it->value().is_object())
    {
        const auto& tk = it->value().as_object();
        config.tok.secret = get_string(tk, "secret", insecure_default_secret);
        if (config.tok.secret.empty())
        {
            return std::unexpected("'secret' must not be empty");
        }
        if (auto ttl = get_uint<uint32_t>(tk, "access_ttl_min", 1, 1440, 120); ttl)
        {
            config.tok.access_ttl = std::chrono::minutes(*ttl);
        }
        else
        {
            return std::unexpected(ttl.error());
        }
        if (auto ttl = get_uint<uint32_t>(tk, "refresh_ttl_days", 1, 90, 7); ttl)
        {
            config.tok.refresh_ttl = std::chrono::days(*ttl);
        }
        else
        {
            return std::unexpected(ttl.error());
        }
    }
    if (auto it = root.find("lockout"); it != root.end() && it->value().is_object())
    {
        const auto& lk = it->value().as_object();
        if (auto max_att = get_uint<uint32_t>(lk, "max_attempts", 1, 100, 5); max_att)
        {
            config.lock.max_attempts = *max_att;
        }
        else
        {
            return std::unexpected(max_att.error());
        }
        if (auto window = get_uint<uint32_t>(lk, "window_minutes", 1, 1440, 60); window)
        {
            config.lock.window = std::chrono::minutes(*window);
        }
        else
        {
            return std::unexpected(window.error());
        }
        if (auto dur = get_uint<uint32_t>(lk, "lockout_minutes", 1, 1440, 15); dur)
        {
            config.lock.lockout = std::chrono::minutes(*dur);
        }
        else
        {
            return std::unexpected(dur.error());
        }
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        config.log.level = get_string(log, "level", "info");
        config.log.file = get_string(log, "file", "");
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(log, "enable_console", true);
    }
    return config;
}
