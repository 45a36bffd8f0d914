#include <catch2/catch_test_macros.hpp>

#include "auth/lockout_tracker.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>

using namespace auth;
using namespace std::chrono_literals;
using test_support::ManualClock;

namespace
{

Config::LockoutCfg defaults()
{
    return Config::LockoutCfg{};
}

FailureOutcome fail(LockoutTracker& tracker, std::string_view user, std::optional<std::string> ip = std::nullopt)
{
    auto out = tracker.record_failure(user, ip);
    REQUIRE(out.has_value());
    return *out;
}

}

TEST_CASE("First failure creates a record with count 1")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    auto out = fail(tracker, "bob", std::string("192.0.2.1"));

    CHECK(out.attempt_count == 1);
    CHECK_FALSE(out.locked);
    CHECK_FALSE(out.locked_until.has_value());

    auto st = tracker.status("bob");
    REQUIRE(st.has_value());
    CHECK(st->attempt_count == 1);
    CHECK(st->source_address == "192.0.2.1");
    CHECK(st->window_start == clock.now());
    CHECK_FALSE(tracker.is_locked("bob").locked);
}

TEST_CASE("Reaching max_attempts within the window locks for the lockout duration")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (uint32_t i = 1; i < 5; ++i)
    {
        auto out = fail(tracker, "bob");
        CHECK(out.attempt_count == i);
        CHECK_FALSE(out.locked);
        clock.advance(1min);
    }

    auto fifth = fail(tracker, "bob");
    CHECK(fifth.attempt_count == 5);
    CHECK(fifth.locked);
    REQUIRE(fifth.locked_until.has_value());
    CHECK(*fifth.locked_until == clock.now() + 15min);

    auto state = tracker.is_locked("bob");
    CHECK(state.locked);
    CHECK(state.locked_until == fifth.locked_until);
}

TEST_CASE("Failures while locked neither count nor extend the lock")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 5; ++i)
    {
        (void)fail(tracker, "bob");
    }
    auto until = tracker.is_locked("bob").locked_until;
    REQUIRE(until.has_value());

    clock.advance(5min);
    auto out = fail(tracker, "bob", std::string("198.51.100.7"));

    CHECK(out.locked);
    CHECK(out.attempt_count == 5);
    CHECK(out.locked_until == until);
    CHECK(tracker.status("bob")->source_address != "198.51.100.7");
}

TEST_CASE("Lock expires once the clock passes locked_until")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 5; ++i)
    {
        (void)fail(tracker, "bob");
    }
    REQUIRE(tracker.is_locked("bob").locked);

    clock.advance(15min - 1s);
    CHECK(tracker.is_locked("bob").locked);

    clock.advance(1s);
    CHECK_FALSE(tracker.is_locked("bob").locked);
}

TEST_CASE("A failure after the window has passed starts a fresh count")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 5; ++i)
    {
        (void)fail(tracker, "bob");
    }

    clock.advance(61min);
    auto out = fail(tracker, "bob");

    CHECK(out.attempt_count == 1);
    CHECK_FALSE(out.locked);
    CHECK(tracker.status("bob")->window_start == clock.now());
}

TEST_CASE("The window rolls from the latest failure")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    (void)fail(tracker, "bob");
    clock.advance(50min);
    (void)fail(tracker, "bob");
    clock.advance(50min);
    auto out = fail(tracker, "bob");

    CHECK(out.attempt_count == 3);
}

TEST_CASE("reset_attempts clears the record so the next failure counts from 1")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 3; ++i)
    {
        (void)fail(tracker, "bob");
    }
    CHECK(tracker.reset_attempts("bob"));
    CHECK_FALSE(tracker.status("bob").has_value());

    CHECK(fail(tracker, "bob").attempt_count == 1);
}

TEST_CASE("unlock removes a lock and is idempotent")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 5; ++i)
    {
        (void)fail(tracker, "bob");
    }
    REQUIRE(tracker.is_locked("bob").locked);

    CHECK(tracker.unlock("bob", "admin"));
    CHECK_FALSE(tracker.is_locked("bob").locked);
    CHECK_FALSE(tracker.unlock("bob", "admin"));
    CHECK_FALSE(tracker.unlock("never-failed", "admin"));
}

TEST_CASE("Records are kept per username")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    for (int i = 0; i < 5; ++i)
    {
        (void)fail(tracker, "bob");
    }
    CHECK(tracker.is_locked("bob").locked);
    CHECK_FALSE(tracker.is_locked("carol").locked);
    CHECK(fail(tracker, "carol").attempt_count == 1);
}

TEST_CASE("A lock stored as text with an offset is normalized before comparison")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    // now is 09:00 UTC; 11:10+02:00 is 09:10 UTC, still in the future.
    REQUIRE(db.exec("INSERT INTO failed_login_attempts "
                     "(username, window_start, last_attempt, attempt_count, locked_until) "
                     "VALUES ('legacy', 1736931000, 1736931000, 5, '2025-01-15T11:10:00+02:00');"));

    auto state = tracker.is_locked("legacy");
    CHECK(state.locked);
    CHECK(state.locked_until == time_utils::from_unix(test_support::base_epoch + 600));

    clock.advance(11min);
    CHECK_FALSE(tracker.is_locked("legacy").locked);
}

TEST_CASE("max_attempts of 1 locks on the first failure")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    Config::LockoutCfg cfg;
    cfg.max_attempts = 1;
    LockoutTracker tracker(db, cfg, clock);

    auto out = fail(tracker, "bob");
    CHECK(out.locked);
    CHECK(out.attempt_count == 1);
}

TEST_CASE("A storage failure is reported by record_failure and reads as unlocked")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    LockoutTracker tracker(db, defaults(), clock);

    REQUIRE(db.exec("DROP TABLE failed_login_attempts;"));

    auto out = tracker.record_failure("bob", std::nullopt);
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == Errc::Internal);
    CHECK_FALSE(tracker.is_locked("bob").locked);
    CHECK_FALSE(tracker.status("bob").has_value());
}
