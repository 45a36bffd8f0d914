#pragma once

#include "auth/errors.hpp"
#include "auth/role.hpp"
#include "config.hpp"
#include "fundamentals/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

enum class TokenKind
{
    Access,
    Refresh
};

[[nodiscard]] std::string_view to_string(TokenKind k);

struct SessionClaims
{
    std::string subject;
    int64_t user_id = 0;
    std::optional<Role> role;       // access tokens only
    time_utils::TimePoint issued_at{};
    time_utils::TimePoint expires_at{};
    std::string issuer;
    TokenKind kind = TokenKind::Access;
};

/**
 * Issues and validates HS256-signed session credentials.
 *
 * Token layout: base64url(header) "." base64url(payload) "." base64url(mac),
 * header fixed to {"alg":"HS256","typ":"JWT"}. Validation is stateless;
 * nothing is revoked before it expires.
 */
class TokenService
{
public:
    static constexpr std::string_view issuer = "aac-assistant";
    static constexpr size_t recommended_secret_bytes = 32;

    // Refuses the insecure default secret when `environment` is production.
    [[nodiscard]] static std::expected<TokenService, std::string> create(
        const Config::TokensCfg& cfg,
        std::string_view environment,
        const time_utils::Clock& clock = time_utils::SystemClock::instance());

    ~TokenService();
    TokenService(const TokenService&) = delete;
    TokenService& operator=(const TokenService&) = delete;
    TokenService(TokenService&& other) noexcept;
    TokenService& operator=(TokenService&& other) = delete;

    [[nodiscard]] Result<std::string> issue_access_token(
        int64_t user_id, std::string_view username, Role role,
        std::optional<std::chrono::seconds> ttl = std::nullopt) const;

    [[nodiscard]] Result<std::string> issue_refresh_token(
        int64_t user_id, std::string_view username,
        std::optional<std::chrono::seconds> ttl = std::nullopt) const;

    // Signature, algorithm, issuer, required claims and expiry, all together.
    [[nodiscard]] Result<SessionClaims> validate(std::string_view token) const;

    // validate() plus a kind check; the wrong kind is InvalidToken.
    [[nodiscard]] Result<SessionClaims> validate_access(std::string_view token) const;
    [[nodiscard]] Result<SessionClaims> validate_refresh(std::string_view token) const;

    // Diagnostics only. Skips expiry and claim checks; never authorize on it.
    [[nodiscard]] bool validate_signature_only(std::string_view token) const;

    // Display only. Reads `exp` without verifying the signature.
    [[nodiscard]] std::optional<time_utils::TimePoint> peek_expiry(std::string_view token) const;

    // 64 hex characters from the OpenSSL CSPRNG.
    [[nodiscard]] static std::optional<std::string> generate_secret();

    [[nodiscard]] std::chrono::seconds access_ttl() const { return access_lifetime; }
    [[nodiscard]] std::chrono::seconds refresh_ttl() const { return refresh_lifetime; }

private:
    TokenService(std::string_view secret, const Config::TokensCfg& cfg, const time_utils::Clock& clock);

    [[nodiscard]] Result<std::string> sign(const std::string& payload_json) const;

    std::vector<uint8_t> secret;
    std::chrono::seconds access_lifetime;
    std::chrono::seconds refresh_lifetime;
    std::reference_wrapper<const time_utils::Clock> clock;
};

} // namespace auth
