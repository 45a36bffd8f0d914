#include "auth/lockout_tracker.hpp"
#include "logger.hpp"

namespace auth
{

namespace
{

// One statement per failure so concurrent requests cannot lose an
// increment. SET expressions all see the row as it was before the update.
//   ?1 username  ?2 source  ?3 now  ?4 window cutoff  ?5 max attempts  ?6 lock expiry
constexpr std::string_view record_failure_sql = R"(
    INSERT INTO failed_login_attempts
        (username, ip_address, window_start, last_attempt, attempt_count, locked_until)
    VALUES (?1, ?2, ?3, ?3, 1, CASE WHEN 1 >= ?5 THEN ?6 END)
    ON CONFLICT(username) DO UPDATE SET
        ip_address = CASE
            WHEN locked_until > ?3 THEN ip_address
            ELSE COALESCE(excluded.ip_address, ip_address) END,
        window_start = CASE
            WHEN locked_until > ?3 THEN window_start
            WHEN last_attempt < ?4 THEN ?3
            ELSE window_start END,
        attempt_count = CASE
            WHEN locked_until > ?3 THEN attempt_count
            WHEN last_attempt < ?4 THEN 1
            ELSE attempt_count + 1 END,
        locked_until = CASE
            WHEN locked_until > ?3 THEN locked_until
            WHEN last_attempt < ?4 THEN (CASE WHEN 1 >= ?5 THEN ?6 END)
            WHEN attempt_count + 1 >= ?5 THEN ?6
            ELSE NULL END,
        last_attempt = CASE
            WHEN locked_until > ?3 THEN last_attempt
            ELSE ?3 END
    RETURNING attempt_count, locked_until;
)";

} // namespace

LockoutTracker::LockoutTracker(storage::Database& database,
                               const Config::LockoutCfg& config,
                               const time_utils::Clock& clk)
    : db(database), cfg(config), clock(clk)
{
}

Result<FailureOutcome> LockoutTracker::record_failure(std::string_view username,
                                                      const std::optional<std::string>& source_address)
{
    const auto now = clock.get().now();

    auto stmt = db.get().prepare(record_failure_sql);
    if (!stmt.valid())
    {
        return std::unexpected(Error::make(Errc::Internal));
    }

    stmt.bind(1, username)
        .bind(2, source_address)
        .bind_time(3, now)
        .bind_time(4, now - cfg.window)
        .bind(5, static_cast<int64_t>(cfg.max_attempts))
        .bind_time(6, now + cfg.lockout);

    if (stmt.step() != SQLITE_ROW)
    {
        LOG_ERROR("Failed to record login failure for {}: {}", username, db.get().last_error());
        return std::unexpected(Error::make(Errc::Internal));
    }

    FailureOutcome out;
    out.attempt_count = static_cast<uint32_t>(stmt.column_int(0));
    out.locked_until = stmt.column_time(1);
    out.locked = out.locked_until && *out.locked_until > now;

    if (out.locked)
    {
        LOG_WARN("Account {} locked until {} after {} failed attempts",
                 username, time_utils::format_utc(*out.locked_until), out.attempt_count);
    }
    else
    {
        LOG_DEBUG("Failed attempt {} of {} for {}", out.attempt_count, cfg.max_attempts, username);
    }
    return out;
}

LockState LockoutTracker::is_locked(std::string_view username)
{
    auto stmt = db.get().prepare("SELECT locked_until FROM failed_login_attempts WHERE username = ?;");
    if (!stmt.valid())
    {
        LOG_ERROR("Lock check for {} skipped: {}", username, db.get().last_error());
        return {};
    }
    stmt.bind(1, username);
    if (int rc = stmt.step(); rc != SQLITE_ROW)
    {
        if (rc != SQLITE_DONE)
        {
            LOG_ERROR("Lock check for {} failed: {}", username, db.get().last_error());
        }
        return {};
    }

    // column_time normalizes whatever the column holds to UTC.
    auto until = stmt.column_time(0);
    if (until && *until > clock.get().now())
    {
        return LockState{true, until};
    }
    return {};
}

bool LockoutTracker::remove(std::string_view username, bool& removed)
{
    auto stmt = db.get().prepare("DELETE FROM failed_login_attempts WHERE username = ? RETURNING username;");
    if (!stmt.valid())
    {
        return false;
    }
    stmt.bind(1, username);

    removed = false;
    int rc = stmt.step();
    while (rc == SQLITE_ROW)
    {
        removed = true;
        rc = stmt.step();
    }
    if (rc != SQLITE_DONE)
    {
        LOG_ERROR("Failed to clear login attempts for {}: {}", username, db.get().last_error());
        return false;
    }
    return true;
}

bool LockoutTracker::reset_attempts(std::string_view username)
{
    bool removed = false;
    return remove(username, removed);
}

bool LockoutTracker::unlock(std::string_view username, std::string_view actor)
{
    bool removed = false;
    if (!remove(username, removed))
    {
        return false;
    }
    LOG_INFO("Login attempts for {} cleared by {}{}", username, actor, removed ? "" : " (no record)");
    return removed;
}

std::optional<AttemptStatus> LockoutTracker::status(std::string_view username)
{
    auto stmt = db.get().prepare(
        "SELECT attempt_count, ip_address, window_start, last_attempt, locked_until "
        "FROM failed_login_attempts WHERE username = ?;");
    if (!stmt.valid())
    {
        return std::nullopt;
    }
    stmt.bind(1, username);
    if (stmt.step() != SQLITE_ROW)
    {
        return std::nullopt;
    }

    AttemptStatus st;
    st.attempt_count = static_cast<uint32_t>(stmt.column_int(0));
    st.source_address = stmt.column_opt_text(1);
    st.window_start = stmt.column_time(2).value_or(time_utils::TimePoint{});
    st.last_attempt = stmt.column_time(3).value_or(time_utils::TimePoint{});
    st.locked_until = stmt.column_time(4);
    st.locked = st.locked_until && *st.locked_until > clock.get().now();
    return st;
}

} // namespace auth
