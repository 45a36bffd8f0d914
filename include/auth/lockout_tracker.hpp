#pragma once

#include "auth/errors.hpp"
#include "config.hpp"
#include "fundamentals/time_utils.hpp"
#include "storage/database.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

struct FailureOutcome
{
    bool locked = false;
    std::optional<time_utils::TimePoint> locked_until;
    uint32_t attempt_count = 0;
};

struct LockState
{
    bool locked = false;
    std::optional<time_utils::TimePoint> locked_until;
};

// Diagnostic snapshot of one failed-attempt record.
struct AttemptStatus
{
    uint32_t attempt_count = 0;
    std::optional<std::string> source_address;
    time_utils::TimePoint window_start{};
    time_utils::TimePoint last_attempt{};
    std::optional<time_utils::TimePoint> locked_until;
    bool locked = false;
};

/**
 * Per-username brute-force guard over `failed_login_attempts`.
 *
 *   Clear   - no record, or last failure older than the window
 *   Warning - 1 <= attempt_count < max_attempts, not locked
 *   Locked  - locked_until in the future
 *
 * The window rolls from the most recent failure. A failure recorded while
 * the account is locked leaves the record untouched.
 */
class LockoutTracker
{
public:
    LockoutTracker(storage::Database& db,
                   const Config::LockoutCfg& cfg,
                   const time_utils::Clock& clock = time_utils::SystemClock::instance());

    [[nodiscard]] Result<FailureOutcome> record_failure(std::string_view username,
                                                        const std::optional<std::string>& source_address);

    [[nodiscard]] LockState is_locked(std::string_view username);

    // Called once per successful authentication.
    bool reset_attempts(std::string_view username);

    // Administrative override. True when a record was removed; removing
    // nothing is still a success.
    bool unlock(std::string_view username, std::string_view actor);

    [[nodiscard]] std::optional<AttemptStatus> status(std::string_view username);

    [[nodiscard]] const Config::LockoutCfg& settings() const { return cfg; }

private:
    bool remove(std::string_view username, bool& removed);

    std::reference_wrapper<storage::Database> db;
    Config::LockoutCfg cfg;
    std::reference_wrapper<const time_utils::Clock> clock;
};

} // namespace auth
