#pragma once
#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace json_utils
{

// Body of every failed response: {"detail": "..."}
inline boost::json::object detail_msg(std::string_view detail)
{
    return boost::json::object{
        {"detail", detail}
    };
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

// Integral numbers only; doubles and out-of-range unsigned values fail.
inline std::expected<int64_t, std::string> extract_int64(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    const auto& v = it->value();
    if (v.is_int64())
    {
        return v.as_int64();
    }
    if (v.is_uint64() && v.as_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        return static_cast<int64_t>(v.as_uint64());
    }
    return std::unexpected(std::format("\"{}\" must be an integer", key));
}

// Parses without throwing; nullopt unless the text is a JSON object.
inline std::optional<boost::json::object> parse_object(std::string_view text)
{
    boost::system::error_code ec;
    auto jv = boost::json::parse(text, ec);
    if (ec || !jv.is_object())
    {
        return std::nullopt;
    }
    return std::move(jv.as_object());
}

} // namespace json_utils
