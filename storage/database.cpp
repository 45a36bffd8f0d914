#include "storage/database.hpp"
#include "logger.hpp"

namespace storage
{

Statement& Statement::bind(int idx, std::string_view text)
{
    sqlite3_bind_text(stmt.get(), idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int64_t value)
{
    sqlite3_bind_int64(stmt.get(), idx, value);
    return *this;
}

Statement& Statement::bind(int idx, const std::optional<std::string>& text)
{
    if (text)
    {
        return bind(idx, std::string_view(*text));
    }
    sqlite3_bind_null(stmt.get(), idx);
    return *this;
}

Statement& Statement::bind(int idx, const std::optional<int64_t>& value)
{
    if (value)
    {
        return bind(idx, *value);
    }
    sqlite3_bind_null(stmt.get(), idx);
    return *this;
}

Statement& Statement::bind_time(int idx, time_utils::TimePoint tp)
{
    return bind(idx, time_utils::to_unix(tp));
}

Statement& Statement::bind_time(int idx, const std::optional<time_utils::TimePoint>& tp)
{
    if (tp)
    {
        return bind_time(idx, *tp);
    }
    sqlite3_bind_null(stmt.get(), idx);
    return *this;
}

int Statement::step()
{
    return sqlite3_step(stmt.get());
}

bool Statement::is_null(int col) const
{
    return sqlite3_column_type(stmt.get(), col) == SQLITE_NULL;
}

int64_t Statement::column_int(int col) const
{
    return sqlite3_column_int64(stmt.get(), col);
}

std::string Statement::column_text(int col) const
{
    const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), col));
    return txt ? std::string(txt) : std::string{};
}

std::optional<std::string> Statement::column_opt_text(int col) const
{
    if (is_null(col))
    {
        return std::nullopt;
    }
    return column_text(col);
}

std::optional<int64_t> Statement::column_opt_int(int col) const
{
    if (is_null(col))
    {
        return std::nullopt;
    }
    return column_int(col);
}

std::optional<time_utils::TimePoint> Statement::column_time(int col) const
{
    switch (sqlite3_column_type(stmt.get(), col))
    {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_INTEGER:
            return time_utils::from_unix(column_int(col));
        default:
            return time_utils::normalize_utc(column_text(col));
    }
}

std::expected<Database, std::string> Database::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(std::string(db_path).c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    Database db(handle);

    if (!db.exec("PRAGMA journal_mode=WAL;") ||
        !db.exec("PRAGMA synchronous=NORMAL;") ||
        !db.exec("PRAGMA foreign_keys=ON;"))
    {
        return std::unexpected(db.last_error());
    }
    sqlite3_busy_timeout(handle, 5000);

    return db;
}

Database::Database(sqlite3* handle)
    : db(handle)
{
}

Database::~Database()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

Database::Database(Database&& other) noexcept
    : db(other.db)
{
    other.db = nullptr;
}

Database& Database::operator=(Database&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        other.db = nullptr;
    }
    return *this;
}

bool Database::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT NOT NULL UNIQUE,
            email TEXT UNIQUE,
            password_hash TEXT NOT NULL,
            display_name TEXT NOT NULL DEFAULT '',
            user_type TEXT NOT NULL DEFAULT 'student'
                CHECK (user_type IN ('student', 'teacher', 'admin')),
            is_active INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER DEFAULT (strftime('%s', 'now')),
            last_login INTEGER DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS student_teachers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            student_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            teacher_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            created_at INTEGER DEFAULT (strftime('%s', 'now')),
            UNIQUE (student_id, teacher_id)
        );
        CREATE INDEX IF NOT EXISTS idx_student_teachers_teacher ON student_teachers(teacher_id);

        CREATE TABLE IF NOT EXISTS failed_login_attempts (
            username TEXT PRIMARY KEY,
            ip_address TEXT,
            window_start INTEGER NOT NULL,
            last_attempt INTEGER NOT NULL,
            attempt_count INTEGER NOT NULL DEFAULT 1 CHECK (attempt_count >= 1),
            locked_until INTEGER
        ) WITHOUT ROWID;

        CREATE TABLE IF NOT EXISTS audit_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp INTEGER NOT NULL,
            event_type TEXT NOT NULL,
            severity TEXT NOT NULL,
            user_id INTEGER,
            username TEXT,
            user_type TEXT,
            ip_address TEXT,
            endpoint TEXT,
            description TEXT NOT NULL,
            additional_data TEXT,
            success INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_audit_logs_timestamp ON audit_logs(timestamp);
        CREATE INDEX IF NOT EXISTS idx_audit_logs_username ON audit_logs(username);
        CREATE INDEX IF NOT EXISTS idx_audit_logs_event_type ON audit_logs(event_type);

        CREATE TRIGGER IF NOT EXISTS audit_logs_append_only
        BEFORE UPDATE ON audit_logs
        BEGIN
            SELECT RAISE(ABORT, 'audit_logs is append-only');
        END;

        CREATE TRIGGER IF NOT EXISTS audit_logs_no_delete
        BEFORE DELETE ON audit_logs
        BEGIN
            SELECT RAISE(ABORT, 'audit_logs is append-only');
        END;
    )";

    if (!exec(sql))
    {
        LOG_ERROR("Schema initialisation failed: {}", last_error());
        return false;
    }
    return true;
}

Statement Database::prepare(std::string_view sql)
{
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK)
    {
        LOG_ERROR("SQL prepare failed: {}", sqlite3_errmsg(db));
        return Statement{};
    }
    return Statement{raw};
}

bool Database::exec(std::string_view sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, std::addressof(err));
    if (err)
    {
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

int Database::changes() const
{
    return sqlite3_changes(db);
}

std::string Database::last_error() const
{
    return db ? sqlite3_errmsg(db) : "database closed";
}

} // namespace storage
