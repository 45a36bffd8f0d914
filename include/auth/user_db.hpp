#pragma once

#include "auth/user_directory.hpp"
#include "storage/database.hpp"

#include <functional>

namespace auth
{

// SQLite-backed directory over the `users` and `student_teachers` tables.
class UserDB final : public UserDirectory, public RelationshipLookup
{
public:
    explicit UserDB(storage::Database& db);

    std::optional<UserRecord> find_by_username(std::string_view username) override;
    std::optional<UserRecord> find_by_id(int64_t id) override;
    std::optional<UserRecord> find_by_email(std::string_view email) override;
    std::vector<UserRecord> list_users(std::optional<Role> role) override;

    std::expected<int64_t, std::string> create_user(const NewUser& user) override;
    bool update_password(int64_t id, std::string_view password_hash) override;
    bool update_last_login(int64_t id, time_utils::TimePoint at) override;
    bool set_active(int64_t id, bool active) override;
    bool set_role(int64_t id, Role role) override;
    bool delete_user(int64_t id) override;

    size_t assignment_count(int64_t teacher_id) override;
    bool is_assigned(int64_t teacher_id, int64_t student_id) override;

    [[nodiscard]] bool assign(int64_t teacher_id, int64_t student_id);
    [[nodiscard]] bool unassign(int64_t teacher_id, int64_t student_id);

private:
    std::optional<UserRecord> find_one(std::string_view where, std::function<void(storage::Statement&)> binder);
    bool update_one(std::string_view sql, std::function<void(storage::Statement&)> binder);

    std::reference_wrapper<storage::Database> db;
};

} // namespace auth
