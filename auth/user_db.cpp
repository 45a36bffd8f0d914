#include "auth/user_db.hpp"
#include "logger.hpp"

#include <format>

namespace auth
{

namespace
{

constexpr std::string_view select_cols =
    "SELECT id, username, email, display_name, password_hash, user_type, is_active, created_at, last_login FROM users ";

UserRecord read_user(const storage::Statement& stmt)
{
    UserRecord rec;
    rec.id = stmt.column_int(0);
    rec.username = stmt.column_text(1);
    rec.email = stmt.column_opt_text(2);
    rec.display_name = stmt.column_text(3);
    rec.password_hash = stmt.column_text(4);
    rec.role = parse_role(stmt.column_text(5)).value_or(lowest_privilege_role);
    rec.active = stmt.column_int(6) != 0;
    rec.created_at = stmt.column_int(7);
    rec.last_login = stmt.column_int(8);
    return rec;
}

} // namespace

UserDB::UserDB(storage::Database& database)
    : db(database)
{
}

std::optional<UserRecord> UserDB::find_one(std::string_view where, std::function<void(storage::Statement&)> binder)
{
    auto stmt = db.get().prepare(std::format("{}{};", select_cols, where));
    if (!stmt.valid())
    {
        return std::nullopt;
    }
    binder(stmt);

    if (stmt.step() == SQLITE_ROW)
    {
        return read_user(stmt);
    }
    return std::nullopt;
}

bool UserDB::update_one(std::string_view sql, std::function<void(storage::Statement&)> binder)
{
    auto stmt = db.get().prepare(sql);
    if (!stmt.valid())
    {
        return false;
    }
    binder(stmt);
    // Statements end in RETURNING so a matched row shows up as SQLITE_ROW.
    return stmt.step() == SQLITE_ROW;
}

std::optional<UserRecord> UserDB::find_by_username(std::string_view username)
{
    return find_one("WHERE username = ?", [&](storage::Statement& s) { s.bind(1, username); });
}

std::optional<UserRecord> UserDB::find_by_id(int64_t id)
{
    return find_one("WHERE id = ?", [&](storage::Statement& s) { s.bind(1, id); });
}

std::optional<UserRecord> UserDB::find_by_email(std::string_view email)
{
    return find_one("WHERE email = ?", [&](storage::Statement& s) { s.bind(1, email); });
}

std::vector<UserRecord> UserDB::list_users(std::optional<Role> role)
{
    std::vector<UserRecord> users;
    auto stmt = db.get().prepare(role
        ? std::format("{}WHERE user_type = ? ORDER BY id;", select_cols)
        : std::format("{}ORDER BY id;", select_cols));
    if (!stmt.valid())
    {
        return users;
    }
    if (role)
    {
        stmt.bind(1, to_string(*role));
    }

    while (stmt.step() == SQLITE_ROW)
    {
        users.push_back(read_user(stmt));
    }
    return users;
}

std::expected<int64_t, std::string> UserDB::create_user(const NewUser& user)
{
    auto stmt = db.get().prepare(
        "INSERT INTO users (username, email, display_name, password_hash, user_type) "
        "VALUES (?, ?, ?, ?, ?) RETURNING id;");
    if (!stmt.valid())
    {
        return std::unexpected(db.get().last_error());
    }

    stmt.bind(1, user.username)
        .bind(2, user.email)
        .bind(3, user.display_name.empty() ? user.username : user.display_name)
        .bind(4, user.password_hash)
        .bind(5, to_string(user.role));

    if (stmt.step() != SQLITE_ROW)
    {
        return std::unexpected(db.get().last_error());
    }
    return stmt.column_int(0);
}

bool UserDB::update_password(int64_t id, std::string_view password_hash)
{
    return update_one("UPDATE users SET password_hash = ? WHERE id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind(1, password_hash).bind(2, id); });
}

bool UserDB::update_last_login(int64_t id, time_utils::TimePoint at)
{
    return update_one("UPDATE users SET last_login = ? WHERE id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind_time(1, at).bind(2, id); });
}

bool UserDB::set_active(int64_t id, bool active)
{
    return update_one("UPDATE users SET is_active = ? WHERE id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind(1, int64_t{active ? 1 : 0}).bind(2, id); });
}

bool UserDB::set_role(int64_t id, Role role)
{
    return update_one("UPDATE users SET user_type = ? WHERE id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind(1, to_string(role)).bind(2, id); });
}

bool UserDB::delete_user(int64_t id)
{
    return update_one("DELETE FROM users WHERE id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind(1, id); });
}

size_t UserDB::assignment_count(int64_t teacher_id)
{
    auto stmt = db.get().prepare("SELECT COUNT(*) FROM student_teachers WHERE teacher_id = ?;");
    if (!stmt.valid())
    {
        return 0;
    }
    stmt.bind(1, teacher_id);
    if (stmt.step() != SQLITE_ROW)
    {
        return 0;
    }
    return static_cast<size_t>(stmt.column_int(0));
}

bool UserDB::is_assigned(int64_t teacher_id, int64_t student_id)
{
    auto stmt = db.get().prepare(
        "SELECT 1 FROM student_teachers WHERE teacher_id = ? AND student_id = ? LIMIT 1;");
    if (!stmt.valid())
    {
        return false;
    }
    stmt.bind(1, teacher_id).bind(2, student_id);
    return stmt.step() == SQLITE_ROW;
}

bool UserDB::assign(int64_t teacher_id, int64_t student_id)
{
    auto stmt = db.get().prepare(
        "INSERT OR IGNORE INTO student_teachers (teacher_id, student_id) VALUES (?, ?);");
    if (!stmt.valid())
    {
        return false;
    }
    stmt.bind(1, teacher_id).bind(2, student_id);
    if (stmt.step() != SQLITE_DONE)
    {
        LOG_WARN("Failed to assign student {} to teacher {}: {}", student_id, teacher_id, db.get().last_error());
        return false;
    }
    return true;
}

bool UserDB::unassign(int64_t teacher_id, int64_t student_id)
{
    return update_one("DELETE FROM student_teachers WHERE teacher_id = ? AND student_id = ? RETURNING id;",
                      [&](storage::Statement& s) { s.bind(1, teacher_id).bind(2, student_id); });
}

} // namespace auth
