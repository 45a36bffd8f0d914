#pragma once

#include "audit/audit_trail.hpp"
#include "auth/authorization_policy.hpp"
#include "auth/errors.hpp"
#include "auth/lockout_tracker.hpp"
#include "auth/role.hpp"
#include "auth/token_service.hpp"
#include "auth/user_directory.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

using SourceAddress = std::optional<std::string>;

struct LoginRequest
{
    std::string username;
    std::string password;
    SourceAddress source_address;
};

struct TokenPair
{
    std::string access_token;
    std::string refresh_token;
    std::string token_type = "bearer";
};

struct AccessGrant
{
    std::string access_token;
    std::string token_type = "bearer";
};

struct RegisterRequest
{
    std::string username;
    std::string password;
    std::optional<std::string> email;
    std::string display_name;
    // Whatever the caller asked for; public registration never honours it.
    std::optional<std::string> requested_role;
    SourceAddress source_address;
};

struct CreateUserRequest
{
    std::string username;
    std::string password;
    std::string confirm_password;
    std::optional<std::string> email;
    std::string display_name;
    std::string role;
};

struct ChangePasswordRequest
{
    std::string current_password;
    std::string new_password;
    std::string confirm_password;
};

/**
 * The account workflows: login, refresh, registration, password changes and
 * administrator actions. Holds references to collaborators constructed once
 * at startup; owns no state of its own.
 */
class AccountService
{
public:
    AccountService(UserDirectory& directory,
                   RelationshipLookup& relationships,
                   LockoutTracker& lockout,
                   audit::AuditTrail& audit,
                   const TokenService& tokens,
                   const time_utils::Clock& clock = time_utils::SystemClock::instance());

    // Lock check, user lookup, active check, password verification, then
    // either a recorded failure or an attempt reset, an audit record and
    // a fresh token pair.
    [[nodiscard]] Result<TokenPair> login(const LoginRequest& req);

    // Mints a new access token carrying the user's current role.
    [[nodiscard]] Result<AccessGrant> refresh(std::string_view refresh_token, const SourceAddress& source = {});

    // Public self-registration. Always creates the lowest-privilege role.
    [[nodiscard]] Result<UserRecord> register_user(const RegisterRequest& req);

    [[nodiscard]] Result<UserRecord> admin_create_user(const Principal& admin, const CreateUserRequest& req,
                                                       const SourceAddress& source = {});

    // Own password only.
    [[nodiscard]] Result<void> change_password(const Principal& actor, const ChangePasswordRequest& req,
                                               const SourceAddress& source = {});

    // Idempotent. The value tells whether lockout records were removed.
    [[nodiscard]] Result<bool> admin_unlock(const Principal& admin, std::string_view username,
                                            const SourceAddress& source = {});

    // Accepts "Bearer <token>" or a bare access token.
    [[nodiscard]] Result<Principal> authenticate(std::string_view bearer);

    // Denials are written to the audit trail.
    [[nodiscard]] Result<void> authorize(const Principal& actor, Resource resource, int64_t target_user_id);

    [[nodiscard]] Result<void> admin_set_active(const Principal& admin, int64_t target_user_id, bool active,
                                                const SourceAddress& source = {});
    [[nodiscard]] Result<void> admin_set_role(const Principal& admin, int64_t target_user_id, Role role,
                                              const SourceAddress& source = {});
    [[nodiscard]] Result<void> admin_reset_password(const Principal& admin, int64_t target_user_id,
                                                    std::string_view new_password,
                                                    const SourceAddress& source = {});
    [[nodiscard]] Result<void> admin_delete_user(const Principal& admin, int64_t target_user_id,
                                                 const SourceAddress& source = {});

    // Admins see everyone (optionally one role); teachers see the students
    // in their scope; students are refused.
    [[nodiscard]] Result<std::vector<UserRecord>> visible_users(const Principal& actor,
                                                                std::optional<Role> role_filter = std::nullopt);

private:
    [[nodiscard]] Result<void> require_admin(const Principal& actor, int64_t target_user_id);
    [[nodiscard]] Result<UserRecord> find_target(int64_t target_user_id);
    [[nodiscard]] Result<void> check_new_account(std::string_view username, const std::optional<std::string>& email);
    [[nodiscard]] Result<UserRecord> create_account(NewUser user);
    [[nodiscard]] Error locked_error(time_utils::TimePoint until) const;

    std::reference_wrapper<UserDirectory> directory;
    std::reference_wrapper<RelationshipLookup> relationships;
    std::reference_wrapper<LockoutTracker> lockout;
    std::reference_wrapper<audit::AuditTrail> trail;
    std::reference_wrapper<const TokenService> tokens;
    std::reference_wrapper<const time_utils::Clock> clock;
};

} // namespace auth
