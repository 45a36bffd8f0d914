#include "auth/account_service.hpp"
#include "auth/credential_verifier.hpp"
#include "auth/password_policy.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace auth
{

namespace
{

std::string_view strip_bearer(std::string_view header)
{
    constexpr std::string_view prefix = "Bearer ";
    if (header.size() > prefix.size() &&
        std::ranges::equal(header.substr(0, prefix.size()), prefix,
                           [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) ==
                                                       std::tolower(static_cast<unsigned char>(b)); }))
    {
        header.remove_prefix(prefix.size());
    }
    while (!header.empty() && header.front() == ' ')
    {
        header.remove_prefix(1);
    }
    return header;
}

Principal principal_of(const UserRecord& rec)
{
    return Principal{rec.id, rec.username, rec.role};
}

bool has_value(const std::optional<std::string>& s)
{
    return s && !s->empty();
}

} // namespace

AccountService::AccountService(UserDirectory& dir,
                               RelationshipLookup& rel,
                               LockoutTracker& lock,
                               audit::AuditTrail& audit_trail,
                               const TokenService& token_service,
                               const time_utils::Clock& clk)
    : directory(dir),
      relationships(rel),
      lockout(lock),
      trail(audit_trail),
      tokens(token_service),
      clock(clk)
{
}

Error AccountService::locked_error(time_utils::TimePoint until) const
{
    Error err = Error::make(Errc::AccountLocked,
        std::format("Account is temporarily locked due to multiple failed login attempts. "
                    "Try again after {}", time_utils::format_utc(until)));
    err.locked_until = until;
    return err;
}

Result<TokenPair> AccountService::login(const LoginRequest& req)
{
    // Oversized names cannot belong to an account and are not tracked.
    if (req.username.empty() || req.username.size() > max_username_length)
    {
        return std::unexpected(Error::make(Errc::InvalidCredentials));
    }

    if (auto state = lockout.get().is_locked(req.username); state.locked)
    {
        trail.get().log(audit::events::login_failed(req.username, req.source_address, "account locked"));
        return std::unexpected(locked_error(*state.locked_until));
    }

    auto user = directory.get().find_by_username(req.username);

    if (user && !user->active)
    {
        trail.get().log(audit::events::login_failed(req.username, req.source_address, "account inactive"));
        return std::unexpected(Error::make(Errc::AccountInactive));
    }

    if (!user || !CredentialVerifier::verify(req.password, user->password_hash))
    {
        trail.get().log(audit::events::login_failed(req.username, req.source_address,
                                                    user ? "wrong password" : "unknown user"));

        auto outcome = lockout.get().record_failure(req.username, req.source_address);
        if (!outcome)
        {
            LOG_ERROR("Could not record failed login for {}", req.username);
        }
        else if (outcome->locked)
        {
            trail.get().log(audit::events::account_locked(req.username, *outcome->locked_until,
                                                          outcome->attempt_count, req.source_address));
            return std::unexpected(locked_error(*outcome->locked_until));
        }
        return std::unexpected(Error::make(Errc::InvalidCredentials));
    }

    if (!lockout.get().reset_attempts(req.username))
    {
        LOG_WARN("Could not clear failed attempts for {}", req.username);
    }
    if (!directory.get().update_last_login(user->id, clock.get().now()))
    {
        LOG_WARN("Could not update last login for {}", user->username);
    }

    const auto principal = principal_of(*user);
    trail.get().log(audit::events::login_success(principal, req.source_address));

    auto access = tokens.get().issue_access_token(user->id, user->username, user->role);
    if (!access)
    {
        return std::unexpected(access.error());
    }
    auto refresh_token = tokens.get().issue_refresh_token(user->id, user->username);
    if (!refresh_token)
    {
        return std::unexpected(refresh_token.error());
    }

    LOG_INFO("User {} logged in", user->username);
    return TokenPair{std::move(*access), std::move(*refresh_token)};
}

Result<AccessGrant> AccountService::refresh(std::string_view refresh_token, const SourceAddress& source)
{
    auto claims = tokens.get().validate_refresh(refresh_token);
    if (!claims)
    {
        return std::unexpected(claims.error());
    }

    auto user = directory.get().find_by_id(claims->user_id);
    if (!user || user->username != claims->subject)
    {
        return std::unexpected(Error::make(Errc::InvalidToken));
    }
    if (!user->active)
    {
        LOG_WARN("Refresh refused for deactivated account {} from {}", user->username, source.value_or("N/A"));
        return std::unexpected(Error::make(Errc::AccountInactive, "Account has been deactivated"));
    }

    auto access = tokens.get().issue_access_token(user->id, user->username, user->role);
    if (!access)
    {
        return std::unexpected(access.error());
    }
    return AccessGrant{std::move(*access)};
}

Result<void> AccountService::check_new_account(std::string_view username, const std::optional<std::string>& email)
{
    if (auto ok = check_username(username); !ok)
    {
        return ok;
    }
    if (has_value(email))
    {
        if (auto ok = check_email(*email); !ok)
        {
            return ok;
        }
    }
    if (directory.get().find_by_username(username))
    {
        return std::unexpected(Error::make(Errc::Conflict, "Username already registered"));
    }
    if (has_value(email) && directory.get().find_by_email(*email))
    {
        return std::unexpected(Error::make(Errc::Conflict, "Email already registered"));
    }
    return {};
}

Result<UserRecord> AccountService::create_account(NewUser user)
{
    auto id = directory.get().create_user(user);
    if (!id)
    {
        LOG_ERROR("Failed to create user {}: {}", user.username, id.error());
        return std::unexpected(Error::make(Errc::Internal));
    }
    auto rec = directory.get().find_by_id(*id);
    if (!rec)
    {
        return std::unexpected(Error::make(Errc::Internal));
    }
    return *rec;
}

Result<UserRecord> AccountService::register_user(const RegisterRequest& req)
{
    if (auto ok = check_new_account(req.username, req.email); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_password(req.password); !ok)
    {
        return std::unexpected(ok.error());
    }

    if (has_value(req.requested_role) && parse_role(*req.requested_role) != lowest_privilege_role)
    {
        LOG_WARN("Registration for {} requested role '{}', downgraded", req.username, *req.requested_role);
        trail.get().log(audit::events::privilege_escalation_attempt(req.username, *req.requested_role,
                                                                    req.source_address));
    }

    auto hash = CredentialVerifier::hash(req.password);
    if (!hash)
    {
        return std::unexpected(hash.error());
    }

    auto rec = create_account(NewUser{
        req.username,
        has_value(req.email) ? req.email : std::nullopt,
        req.display_name,
        std::move(*hash),
        lowest_privilege_role,
    });
    if (!rec)
    {
        return rec;
    }

    trail.get().log(audit::events::account_created(rec->id, rec->username, rec->role, nullptr,
                                                   req.source_address));
    LOG_INFO("Registered user {}", rec->username);
    return rec;
}

Result<UserRecord> AccountService::admin_create_user(const Principal& admin, const CreateUserRequest& req,
                                                     const SourceAddress& source)
{
    if (auto ok = require_admin(admin, 0); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_new_account(req.username, req.email); !ok)
    {
        return std::unexpected(ok.error());
    }
    auto role = parse_role(req.role);
    if (!role)
    {
        return std::unexpected(Error::make(Errc::InvalidInput,
                                           "Invalid role. Must be one of: student, teacher, admin"));
    }
    if (req.password != req.confirm_password)
    {
        return std::unexpected(Error::make(Errc::PasswordMismatch));
    }
    if (auto ok = check_password(req.password); !ok)
    {
        return std::unexpected(ok.error());
    }

    auto hash = CredentialVerifier::hash(req.password);
    if (!hash)
    {
        return std::unexpected(hash.error());
    }

    auto rec = create_account(NewUser{
        req.username,
        has_value(req.email) ? req.email : std::nullopt,
        req.display_name,
        std::move(*hash),
        *role,
    });
    if (!rec)
    {
        return rec;
    }

    trail.get().log(audit::events::account_created(rec->id, rec->username, rec->role, &admin, source));
    LOG_INFO("Administrator {} created {} account {}", admin.username, to_string(rec->role), rec->username);
    return rec;
}

Result<void> AccountService::change_password(const Principal& actor, const ChangePasswordRequest& req,
                                             const SourceAddress& source)
{
    auto user = directory.get().find_by_id(actor.user_id);
    if (!user)
    {
        return std::unexpected(Error::make(Errc::NotFound));
    }

    if (!CredentialVerifier::verify(req.current_password, user->password_hash))
    {
        return std::unexpected(Error::make(Errc::InvalidCredentials, "Current password is incorrect"));
    }
    if (auto ok = check_password(req.new_password); !ok)
    {
        return ok;
    }
    if (req.new_password != req.confirm_password)
    {
        return std::unexpected(Error::make(Errc::PasswordMismatch));
    }

    auto hash = CredentialVerifier::hash(req.new_password);
    if (!hash)
    {
        return std::unexpected(hash.error());
    }
    if (!directory.get().update_password(user->id, *hash))
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    trail.get().log(audit::events::password_changed(principal_of(*user), false, source));
    return {};
}

Result<bool> AccountService::admin_unlock(const Principal& admin, std::string_view username,
                                          const SourceAddress& source)
{
    if (auto ok = require_admin(admin, 0); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (!directory.get().find_by_username(username))
    {
        return std::unexpected(Error::make(Errc::NotFound));
    }

    bool removed = lockout.get().unlock(username, admin.username);
    trail.get().log(audit::events::account_unlocked(username, admin, source));
    return removed;
}

Result<Principal> AccountService::authenticate(std::string_view bearer)
{
    auto token = strip_bearer(bearer);
    if (token.empty())
    {
        return std::unexpected(Error::make(Errc::InvalidToken));
    }

    auto claims = tokens.get().validate_access(token);
    if (!claims)
    {
        return std::unexpected(claims.error());
    }

    auto user = directory.get().find_by_id(claims->user_id);
    if (!user || user->username != claims->subject)
    {
        return std::unexpected(Error::make(Errc::InvalidToken));
    }
    if (!user->active)
    {
        return std::unexpected(Error::make(Errc::AccountInactive));
    }
    return principal_of(*user);
}

Result<UserRecord> AccountService::find_target(int64_t target_user_id)
{
    auto target = directory.get().find_by_id(target_user_id);
    if (!target)
    {
        return std::unexpected(Error::make(Errc::NotFound));
    }
    return *target;
}

Result<void> AccountService::require_admin(const Principal& actor, int64_t target_user_id)
{
    if (actor.role == Role::Admin)
    {
        return {};
    }
    trail.get().log(audit::events::access_denied(actor, to_string(Resource::UserManagement),
                                                 target_user_id, "admin role required"));
    return std::unexpected(Error::make(Errc::Unauthorized, "Admin access required"));
}

Result<void> AccountService::authorize(const Principal& actor, Resource resource, int64_t target_user_id)
{
    auto target = find_target(target_user_id);
    if (!target)
    {
        return std::unexpected(target.error());
    }

    auto decision = AuthorizationPolicy::check(actor, target->id, target->role, resource, relationships.get());
    if (!decision)
    {
        trail.get().log(audit::events::access_denied(actor, to_string(resource), target->id, decision.reason));
        return std::unexpected(Error::make(Errc::Unauthorized));
    }
    return {};
}

Result<void> AccountService::admin_set_active(const Principal& admin, int64_t target_user_id, bool active,
                                              const SourceAddress& source)
{
    if (auto ok = require_admin(admin, target_user_id); !ok)
    {
        return ok;
    }
    auto target = find_target(target_user_id);
    if (!target)
    {
        return std::unexpected(target.error());
    }
    if (!active && target->id == admin.user_id)
    {
        return std::unexpected(Error::make(Errc::InvalidInput, "Cannot deactivate your own account"));
    }
    if (!directory.get().set_active(target->id, active))
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    trail.get().log(audit::events::admin_action(
        admin, active ? "activate_user" : "deactivate_user",
        std::format("{} {} account {}", admin.username, active ? "activated" : "deactivated", target->username),
        source, audit::endpoints::users));
    return {};
}

Result<void> AccountService::admin_set_role(const Principal& admin, int64_t target_user_id, Role role,
                                            const SourceAddress& source)
{
    if (auto ok = require_admin(admin, target_user_id); !ok)
    {
        return ok;
    }
    auto target = find_target(target_user_id);
    if (!target)
    {
        return std::unexpected(target.error());
    }
    if (target->id == admin.user_id)
    {
        return std::unexpected(Error::make(Errc::InvalidInput, "Cannot change your own role"));
    }
    if (!directory.get().set_role(target->id, role))
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    trail.get().log(audit::events::admin_action(
        admin, "change_role",
        std::format("{} changed role of {} from {} to {}", admin.username, target->username,
                    to_string(target->role), to_string(role)),
        source, audit::endpoints::users));
    return {};
}

Result<void> AccountService::admin_reset_password(const Principal& admin, int64_t target_user_id,
                                                  std::string_view new_password, const SourceAddress& source)
{
    if (auto ok = require_admin(admin, target_user_id); !ok)
    {
        return ok;
    }
    auto target = find_target(target_user_id);
    if (!target)
    {
        return std::unexpected(target.error());
    }
    if (auto ok = check_password(new_password); !ok)
    {
        return ok;
    }

    auto hash = CredentialVerifier::hash(new_password);
    if (!hash)
    {
        return std::unexpected(hash.error());
    }
    if (!directory.get().update_password(target->id, *hash))
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    trail.get().log(audit::events::password_changed(principal_of(*target), true, source));
    trail.get().log(audit::events::admin_action(
        admin, "reset_password", std::format("{} reset the password of {}", admin.username, target->username),
        source, audit::endpoints::users));
    return {};
}

Result<void> AccountService::admin_delete_user(const Principal& admin, int64_t target_user_id,
                                               const SourceAddress& source)
{
    if (auto ok = require_admin(admin, target_user_id); !ok)
    {
        return ok;
    }
    auto target = find_target(target_user_id);
    if (!target)
    {
        return std::unexpected(target.error());
    }
    if (target->id == admin.user_id)
    {
        return std::unexpected(Error::make(Errc::InvalidInput, "Cannot delete your own account"));
    }
    if (!directory.get().delete_user(target->id))
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    trail.get().log(audit::events::account_deleted(target->id, target->username, admin, source));
    LOG_INFO("Administrator {} deleted account {}", admin.username, target->username);
    return {};
}

Result<std::vector<UserRecord>> AccountService::visible_users(const Principal& actor,
                                                              std::optional<Role> role_filter)
{
    if (actor.role == Role::Admin)
    {
        return directory.get().list_users(role_filter);
    }
    if (!AuthorizationPolicy::can_list_users(actor) || (role_filter && *role_filter != Role::Student))
    {
        trail.get().log(audit::events::access_denied(actor, to_string(Resource::UserManagement), 0,
                                                     "user listing not permitted"));
        return std::unexpected(Error::make(Errc::Unauthorized));
    }

    auto scope = AuthorizationPolicy::scope_for(actor.user_id, relationships.get());
    auto students = directory.get().list_users(Role::Student);
    std::erase_if(students, [&](const UserRecord& s) {
        return !AuthorizationPolicy::student_visible(actor.user_id, s.id, scope, relationships.get());
    });
    return students;
}

} // namespace auth
