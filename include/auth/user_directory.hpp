#pragma once

#include "auth/user_record.hpp"
#include "fundamentals/time_utils.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

/**
 * Source of user records. The account core reads through this interface;
 * role and active flag are written only from administrator paths.
 */
class UserDirectory
{
public:
    virtual ~UserDirectory() = default;

    [[nodiscard]] virtual std::optional<UserRecord> find_by_username(std::string_view username) = 0;
    [[nodiscard]] virtual std::optional<UserRecord> find_by_id(int64_t id) = 0;
    [[nodiscard]] virtual std::optional<UserRecord> find_by_email(std::string_view email) = 0;
    [[nodiscard]] virtual std::vector<UserRecord> list_users(std::optional<Role> role) = 0;

    // Returns the new id, or a storage error message.
    [[nodiscard]] virtual std::expected<int64_t, std::string> create_user(const NewUser& user) = 0;
    [[nodiscard]] virtual bool update_password(int64_t id, std::string_view password_hash) = 0;
    [[nodiscard]] virtual bool update_last_login(int64_t id, time_utils::TimePoint at) = 0;
    [[nodiscard]] virtual bool set_active(int64_t id, bool active) = 0;
    [[nodiscard]] virtual bool set_role(int64_t id, Role role) = 0;
    [[nodiscard]] virtual bool delete_user(int64_t id) = 0;
};

// Supervisor (teacher) to subordinate (student) assignments.
class RelationshipLookup
{
public:
    virtual ~RelationshipLookup() = default;

    [[nodiscard]] virtual size_t assignment_count(int64_t teacher_id) = 0;
    [[nodiscard]] virtual bool is_assigned(int64_t teacher_id, int64_t student_id) = 0;
};

} // namespace auth
