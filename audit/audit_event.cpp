#include "audit/audit_event.hpp"

#include <array>
#include <format>
#include <utility>

namespace audit
{

namespace
{

constexpr std::array<std::pair<EventType, std::string_view>, 9> event_names{{
    {EventType::LoginSuccess, "login_success"},
    {EventType::LoginFailed, "login_failed"},
    {EventType::PasswordChanged, "password_changed"},
    {EventType::PrivilegeEscalationAttempt, "privilege_escalation_attempt"},
    {EventType::AccountCreated, "account_created"},
    {EventType::AccountDeleted, "account_deleted"},
    {EventType::AdminAction, "admin_action"},
    {EventType::AccountLocked, "account_locked"},
    {EventType::AccountUnlocked, "account_unlocked"},
}};

AuditEvent base(EventType type, Severity severity, std::string description, bool success)
{
    AuditEvent e;
    e.type = type;
    e.severity = severity;
    e.description = std::move(description);
    e.success = success;
    return e;
}

void set_actor(AuditEvent& e, const auth::Principal& p)
{
    e.actor_user_id = p.user_id;
    e.actor_username = p.username;
    e.actor_role = std::string(auth::to_string(p.role));
}

} // namespace

std::string_view to_string(EventType t)
{
    for (const auto& [type, name] : event_names)
    {
        if (type == t)
        {
            return name;
        }
    }
    return "unknown";
}

std::string_view to_string(Severity s)
{
    switch (s)
    {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Critical: return "critical";
    }
    return "info";
}

std::optional<EventType> parse_event_type(std::string_view s)
{
    for (const auto& [type, name] : event_names)
    {
        if (name == s)
        {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view s)
{
    if (s == "info") return Severity::Info;
    if (s == "warning") return Severity::Warning;
    if (s == "critical") return Severity::Critical;
    return std::nullopt;
}

namespace events
{

AuditEvent login_success(const auth::Principal& user, const Source& source)
{
    auto e = base(EventType::LoginSuccess, Severity::Info,
                  std::format("User {} logged in successfully", user.username), true);
    set_actor(e, user);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::token);
    return e;
}

AuditEvent login_failed(std::string_view username, const Source& source, std::string_view reason)
{
    auto e = base(EventType::LoginFailed, Severity::Warning,
                  std::format("Failed login attempt for {}", username), false);
    e.actor_username = std::string(username);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::token);
    e.extra = boost::json::object{{"reason", reason}};
    return e;
}

AuditEvent password_changed(const auth::Principal& user, bool by_admin, const Source& source)
{
    auto e = base(EventType::PasswordChanged, Severity::Info,
                  by_admin ? std::format("Password reset for {} by administrator", user.username)
                           : std::format("User {} changed their password", user.username),
                  true);
    set_actor(e, user);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::change_password);
    e.extra = boost::json::object{{"by_admin", by_admin}};
    return e;
}

AuditEvent privilege_escalation_attempt(std::string_view username, std::string_view attempted_role,
                                        const Source& source)
{
    auto e = base(EventType::PrivilegeEscalationAttempt, Severity::Critical,
                  std::format("Registration requested role '{}' for {}; downgraded to {}",
                              attempted_role, username, auth::to_string(auth::lowest_privilege_role)),
                  false);
    e.actor_username = std::string(username);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::register_user);
    e.extra = boost::json::object{
        {"attempted_role", attempted_role},
        {"assigned_role", auth::to_string(auth::lowest_privilege_role)},
    };
    return e;
}

AuditEvent account_created(int64_t new_id, std::string_view new_username, auth::Role new_role,
                           const auth::Principal* creator, const Source& source)
{
    auto e = base(EventType::AccountCreated, Severity::Info,
                  std::format("Account {} created with role {}", new_username, auth::to_string(new_role)), true);
    if (creator)
    {
        set_actor(e, *creator);
        e.target_endpoint = std::string(endpoints::create_user);
    }
    else
    {
        e.actor_user_id = new_id;
        e.actor_username = std::string(new_username);
        e.actor_role = std::string(auth::to_string(new_role));
        e.target_endpoint = std::string(endpoints::register_user);
    }
    e.source_address = source;
    e.extra = boost::json::object{
        {"new_user_id", new_id},
        {"new_username", new_username},
        {"role", auth::to_string(new_role)},
    };
    return e;
}

AuditEvent account_deleted(int64_t deleted_id, std::string_view deleted_username,
                           const auth::Principal& admin, const Source& source)
{
    auto e = base(EventType::AccountDeleted, Severity::Warning,
                  std::format("Account {} deleted by {}", deleted_username, admin.username), true);
    set_actor(e, admin);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::users);
    e.extra = boost::json::object{{"deleted_user_id", deleted_id}, {"deleted_username", deleted_username}};
    return e;
}

AuditEvent admin_action(const auth::Principal& admin, std::string_view action, std::string_view description,
                        const Source& source, std::optional<std::string_view> endpoint)
{
    auto e = base(EventType::AdminAction, Severity::Info, std::string(description), true);
    set_actor(e, admin);
    e.source_address = source;
    if (endpoint)
    {
        e.target_endpoint = std::string(*endpoint);
    }
    e.extra = boost::json::object{{"action", action}};
    return e;
}

AuditEvent account_locked(std::string_view username, time_utils::TimePoint locked_until, uint32_t attempts,
                          const Source& source)
{
    auto e = base(EventType::AccountLocked, Severity::Warning,
                  std::format("Account {} locked after {} failed attempts", username, attempts), false);
    e.actor_username = std::string(username);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::token);
    e.extra = boost::json::object{
        {"locked_until", time_utils::format_iso(locked_until)},
        {"attempts", attempts},
    };
    return e;
}

AuditEvent account_unlocked(std::string_view username, const auth::Principal& admin, const Source& source)
{
    auto e = base(EventType::AccountUnlocked, Severity::Info,
                  std::format("Account {} unlocked by {}", username, admin.username), true);
    set_actor(e, admin);
    e.source_address = source;
    e.target_endpoint = std::string(endpoints::unlock_account);
    e.extra = boost::json::object{{"unlocked_username", username}};
    return e;
}

AuditEvent access_denied(const auth::Principal& actor, std::string_view resource, int64_t target_user_id,
                         std::string_view reason)
{
    auto e = base(EventType::PrivilegeEscalationAttempt, Severity::Warning,
                  std::format("Access denied: {} on {} for user {}", actor.username, resource, target_user_id),
                  false);
    set_actor(e, actor);
    e.extra = boost::json::object{
        {"resource", resource},
        {"target_user_id", target_user_id},
        {"reason", reason},
    };
    return e;
}

} // namespace events

} // namespace audit
