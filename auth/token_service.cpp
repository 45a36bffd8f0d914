#include "auth/token_service.hpp"
#include "crypto/hmac_sha256.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <boost/json.hpp>
#include <array>

namespace json = boost::json;

namespace auth
{

namespace
{

constexpr std::string_view alg_hs256 = "HS256";
constexpr std::string_view header_json = R"({"alg":"HS256","typ":"JWT"})";

struct TokenParts
{
    std::string_view header;
    std::string_view payload;
    std::string_view signature;
    std::string_view signing_input;
};

std::optional<TokenParts> split_token(std::string_view token)
{
    auto first = token.find('.');
    if (first == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto second = token.find('.', first + 1);
    if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos)
    {
        return std::nullopt;
    }

    TokenParts parts{
        token.substr(0, first),
        token.substr(first + 1, second - first - 1),
        token.substr(second + 1),
        token.substr(0, second),
    };
    if (parts.header.empty() || parts.payload.empty() || parts.signature.empty())
    {
        return std::nullopt;
    }
    return parts;
}

std::optional<json::object> decode_segment(std::string_view segment)
{
    auto raw = crypto::base64url::decode(segment);
    if (!raw)
    {
        return std::nullopt;
    }
    return json_utils::parse_object(*raw);
}

std::unexpected<Error> invalid(std::string_view why)
{
    LOG_DEBUG("Token rejected: {}", why);
    return std::unexpected(Error::make(Errc::InvalidToken));
}

bool header_ok(std::string_view segment)
{
    auto header = decode_segment(segment);
    if (!header)
    {
        return false;
    }
    auto alg = json_utils::extract_str(*header, "alg");
    if (!alg || *alg != alg_hs256)
    {
        return false;
    }
    if (auto it = header->find("typ"); it != header->end())
    {
        return it->value().is_string() && it->value().as_string() == "JWT";
    }
    return true;
}

bool signature_ok(std::span<const uint8_t> key, const TokenParts& parts)
{
    auto mac = crypto::base64url::decode(parts.signature);
    if (!mac)
    {
        return false;
    }
    return crypto::HmacSha256::verify(
        key, parts.signing_input,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(mac->data()), mac->size()));
}

} // namespace

std::string_view to_string(TokenKind k)
{
    return k == TokenKind::Refresh ? "refresh" : "access";
}

std::expected<TokenService, std::string> TokenService::create(const Config::TokensCfg& cfg,
                                                               std::string_view environment,
                                                               const time_utils::Clock& clock)
{
    if (cfg.secret.empty())
    {
        return std::unexpected("Token signing secret is empty");
    }
    if (cfg.secret == Config::insecure_default_secret)
    {
        if (environment == "production")
        {
            return std::unexpected(
                "Refusing to start: the token signing secret is the insecure default in production. "
                "Set JWT_SECRET_KEY or tokens.secret");
        }
        LOG_WARN("Token signing secret is the insecure default; set JWT_SECRET_KEY before deploying");
    }
    else if (cfg.secret.size() < recommended_secret_bytes)
    {
        LOG_WARN("Token signing secret is shorter than {} bytes", recommended_secret_bytes);
    }
    if (cfg.access_ttl <= std::chrono::minutes{0} || cfg.refresh_ttl <= std::chrono::days{0})
    {
        return std::unexpected("Token lifetimes must be positive");
    }

    return TokenService(cfg.secret, cfg, clock);
}

TokenService::TokenService(std::string_view key, const Config::TokensCfg& cfg, const time_utils::Clock& clk)
    : secret(key.begin(), key.end()),
      access_lifetime(cfg.access_ttl),
      refresh_lifetime(cfg.refresh_ttl),
      clock(clk)
{
}

TokenService::TokenService(TokenService&& other) noexcept
    : secret(std::move(other.secret)),
      access_lifetime(other.access_lifetime),
      refresh_lifetime(other.refresh_lifetime),
      clock(other.clock)
{
}

TokenService::~TokenService()
{
    crypto::secure_clear(secret);
}

Result<std::string> TokenService::sign(const std::string& payload_json) const
{
    std::string token = crypto::base64url::encode(header_json);
    token += '.';
    token += crypto::base64url::encode(payload_json);

    auto mac = crypto::HmacSha256::sign(secret, token);
    if (!mac)
    {
        LOG_ERROR("HMAC-SHA256 signing failed");
        return std::unexpected(Error::make(Errc::Internal));
    }
    token += '.';
    token += crypto::base64url::encode(*mac);
    return token;
}

Result<std::string> TokenService::issue_access_token(int64_t user_id, std::string_view username, Role role,
                                                     std::optional<std::chrono::seconds> ttl) const
{
    const auto now = clock.get().now();
    const auto exp = now + ttl.value_or(access_lifetime);

    json::object payload{
        {"sub", username},
        {"user_id", user_id},
        {"user_type", to_string(role)},
        {"iat", time_utils::to_unix(now)},
        {"exp", time_utils::to_unix(exp)},
        {"iss", issuer},
    };
    return sign(json::serialize(payload));
}

Result<std::string> TokenService::issue_refresh_token(int64_t user_id, std::string_view username,
                                                      std::optional<std::chrono::seconds> ttl) const
{
    const auto now = clock.get().now();
    const auto exp = now + ttl.value_or(refresh_lifetime);

    json::object payload{
        {"sub", username},
        {"user_id", user_id},
        {"iat", time_utils::to_unix(now)},
        {"exp", time_utils::to_unix(exp)},
        {"iss", issuer},
        {"type", to_string(TokenKind::Refresh)},
    };
    return sign(json::serialize(payload));
}

Result<SessionClaims> TokenService::validate(std::string_view token) const
{
    auto parts = split_token(token);
    if (!parts)
    {
        return invalid("malformed");
    }
    if (!header_ok(parts->header))
    {
        return invalid("unexpected header");
    }
    if (!signature_ok(secret, *parts))
    {
        return invalid("signature mismatch");
    }

    auto payload = decode_segment(parts->payload);
    if (!payload)
    {
        return invalid("undecodable payload");
    }

    auto sub = json_utils::extract_str(*payload, "sub");
    auto uid = json_utils::extract_int64(*payload, "user_id");
    auto iat = json_utils::extract_int64(*payload, "iat");
    auto exp = json_utils::extract_int64(*payload, "exp");
    if (!sub || sub->empty() || !uid || !iat || !exp)
    {
        return invalid("missing required claim");
    }

    auto iss = json_utils::extract_str(*payload, "iss");
    if (!iss || *iss != issuer)
    {
        return invalid("issuer mismatch");
    }

    SessionClaims claims;
    claims.subject = std::move(*sub);
    claims.user_id = *uid;
    claims.issued_at = time_utils::from_unix(*iat);
    claims.expires_at = time_utils::from_unix(*exp);
    claims.issuer = std::move(*iss);

    if (auto it = payload->find("type"); it != payload->end())
    {
        if (!it->value().is_string() || it->value().as_string() != to_string(TokenKind::Refresh))
        {
            return invalid("unknown token type");
        }
        claims.kind = TokenKind::Refresh;
    }

    if (claims.kind == TokenKind::Access)
    {
        auto user_type = json_utils::extract_str(*payload, "user_type");
        if (!user_type)
        {
            return invalid("access token without role");
        }
        claims.role = parse_role(*user_type);
        if (!claims.role)
        {
            return invalid("unknown role");
        }
    }

    if (clock.get().now() >= claims.expires_at)
    {
        return std::unexpected(Error::make(Errc::TokenExpired));
    }
    return claims;
}

Result<SessionClaims> TokenService::validate_access(std::string_view token) const
{
    auto claims = validate(token);
    if (claims && claims->kind != TokenKind::Access)
    {
        return invalid("refresh token used for access");
    }
    return claims;
}

Result<SessionClaims> TokenService::validate_refresh(std::string_view token) const
{
    auto claims = validate(token);
    if (claims && claims->kind != TokenKind::Refresh)
    {
        return invalid("access token used for refresh");
    }
    return claims;
}

bool TokenService::validate_signature_only(std::string_view token) const
{
    auto parts = split_token(token);
    return parts && header_ok(parts->header) && signature_ok(secret, *parts);
}

std::optional<time_utils::TimePoint> TokenService::peek_expiry(std::string_view token) const
{
    auto parts = split_token(token);
    if (!parts)
    {
        return std::nullopt;
    }
    auto payload = decode_segment(parts->payload);
    if (!payload)
    {
        return std::nullopt;
    }
    auto exp = json_utils::extract_int64(*payload, "exp");
    if (!exp)
    {
        return std::nullopt;
    }
    return time_utils::from_unix(*exp);
}

std::optional<std::string> TokenService::generate_secret()
{
    return crypto::random_hex(recommended_secret_bytes);
}

} // namespace auth
