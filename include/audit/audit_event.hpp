#pragma once

#include "auth/role.hpp"
#include "fundamentals/time_utils.hpp"

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace audit
{

enum class EventType
{
    LoginSuccess,
    LoginFailed,
    PasswordChanged,
    PrivilegeEscalationAttempt,
    AccountCreated,
    AccountDeleted,
    AdminAction,
    AccountLocked,
    AccountUnlocked
};

enum class Severity
{
    Info,
    Warning,
    Critical
};

[[nodiscard]] std::string_view to_string(EventType t);
[[nodiscard]] std::string_view to_string(Severity s);
[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view s);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view s);

// Immutable once written. `timestamp` is stamped by AuditTrail::log.
struct AuditEvent
{
    time_utils::TimePoint timestamp{};
    EventType type = EventType::AdminAction;
    Severity severity = Severity::Info;
    std::optional<int64_t> actor_user_id;
    std::optional<std::string> actor_username;
    std::optional<std::string> actor_role;
    std::optional<std::string> source_address;
    std::optional<std::string> target_endpoint;
    std::string description;
    bool success = true;
    boost::json::value extra;
};

struct StoredEvent
{
    int64_t id;
    AuditEvent event;
};

namespace endpoints
{
constexpr std::string_view token = "/token";
constexpr std::string_view refresh = "/refresh";
constexpr std::string_view register_user = "/register";
constexpr std::string_view create_user = "/admin/create-user";
constexpr std::string_view change_password = "/change-password";
constexpr std::string_view unlock_account = "/admin/unlock-account";
constexpr std::string_view users = "/users";
}

// Shorthand builders, one per event type. They only fill fields.
namespace events
{

using Source = std::optional<std::string>;

[[nodiscard]] AuditEvent login_success(const auth::Principal& user, const Source& source);
[[nodiscard]] AuditEvent login_failed(std::string_view username, const Source& source, std::string_view reason);
[[nodiscard]] AuditEvent password_changed(const auth::Principal& user, bool by_admin, const Source& source);
[[nodiscard]] AuditEvent privilege_escalation_attempt(std::string_view username, std::string_view attempted_role,
                                                      const Source& source);
[[nodiscard]] AuditEvent account_created(int64_t new_id, std::string_view new_username, auth::Role new_role,
                                         const auth::Principal* creator, const Source& source);
[[nodiscard]] AuditEvent account_deleted(int64_t deleted_id, std::string_view deleted_username,
                                         const auth::Principal& admin, const Source& source);
[[nodiscard]] AuditEvent admin_action(const auth::Principal& admin, std::string_view action,
                                      std::string_view description, const Source& source,
                                      std::optional<std::string_view> endpoint = std::nullopt);
[[nodiscard]] AuditEvent account_locked(std::string_view username, time_utils::TimePoint locked_until,
                                        uint32_t attempts, const Source& source);
[[nodiscard]] AuditEvent account_unlocked(std::string_view username, const auth::Principal& admin,
                                          const Source& source);

// Authorization denial: recorded as a warning-level escalation attempt.
[[nodiscard]] AuditEvent access_denied(const auth::Principal& actor, std::string_view resource,
                                       int64_t target_user_id, std::string_view reason);

} // namespace events

} // namespace audit
