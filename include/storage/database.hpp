#pragma once

#include "fundamentals/time_utils.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace storage
{

class Statement
{
public:
    Statement() : stmt(nullptr, &sqlite3_finalize) {}
    explicit Statement(sqlite3_stmt* raw) : stmt(raw, &sqlite3_finalize) {}

    [[nodiscard]] bool valid() const { return stmt != nullptr; }
    [[nodiscard]] sqlite3_stmt* get() const { return stmt.get(); }

    // Binds are 1-based, as in sqlite3_bind_*.
    Statement& bind(int idx, std::string_view text);
    Statement& bind(int idx, const std::string& text) { return bind(idx, std::string_view(text)); }
    Statement& bind(int idx, const char* text) { return bind(idx, std::string_view(text)); }
    Statement& bind(int idx, int64_t value);
    Statement& bind(int idx, const std::optional<std::string>& text);
    Statement& bind(int idx, const std::optional<int64_t>& value);
    Statement& bind_time(int idx, time_utils::TimePoint tp);
    Statement& bind_time(int idx, const std::optional<time_utils::TimePoint>& tp);

    // SQLITE_ROW, SQLITE_DONE or an error code.
    [[nodiscard]] int step();

    [[nodiscard]] bool is_null(int col) const;
    [[nodiscard]] int64_t column_int(int col) const;
    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] std::optional<std::string> column_opt_text(int col) const;
    [[nodiscard]] std::optional<int64_t> column_opt_int(int col) const;

    // Accepts INTEGER epoch seconds or any text form time_utils::normalize_utc
    // understands; NULL or unparseable yields nullopt.
    [[nodiscard]] std::optional<time_utils::TimePoint> column_time(int col) const;

private:
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt;
};

/**
 * Owns the single SQLite connection shared by the directory, the lockout
 * tracker and the audit trail. Opened in serialized threading mode so the
 * handle may be used from concurrent requests.
 */
class Database
{
public:
    [[nodiscard]] static std::expected<Database, std::string> open(std::string_view db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] bool init_schema();

    [[nodiscard]] Statement prepare(std::string_view sql);
    [[nodiscard]] bool exec(std::string_view sql);
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db);
    sqlite3* db;
};

} // namespace storage
