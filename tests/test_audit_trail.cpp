#include <catch2/catch_test_macros.hpp>

#include "audit/audit_trail.hpp"
#include "test_support.hpp"

#include <string>

using namespace audit;
using test_support::ManualClock;

TEST_CASE("AuditTrail persists an event with the clock's timestamp")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    AuditTrail trail(db, clock);

    auth::Principal alice{7, "alice", auth::Role::Teacher};
    auto id = trail.log(events::login_success(alice, std::string("10.0.0.5")));

    REQUIRE(id.has_value());
    auto rows = trail.recent(10);
    REQUIRE(rows.size() == 1);

    const auto& e = rows[0].event;
    CHECK(rows[0].id == *id);
    CHECK(e.timestamp == clock.now());
    CHECK(e.type == EventType::LoginSuccess);
    CHECK(e.severity == Severity::Info);
    CHECK(e.actor_user_id == 7);
    CHECK(e.actor_username == "alice");
    CHECK(e.actor_role == "teacher");
    CHECK(e.source_address == "10.0.0.5");
    CHECK(e.target_endpoint == std::string(endpoints::token));
    CHECK(e.success);
}

TEST_CASE("AuditTrail round-trips the extra payload")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    AuditTrail trail(db, clock);

    REQUIRE(trail.log(events::privilege_escalation_attempt("mallory", "admin", std::nullopt)));

    auto rows = trail.recent(1);
    REQUIRE(rows.size() == 1);
    const auto& e = rows[0].event;
    CHECK(e.type == EventType::PrivilegeEscalationAttempt);
    CHECK(e.severity == Severity::Critical);
    CHECK_FALSE(e.success);
    CHECK_FALSE(e.source_address.has_value());
    REQUIRE(e.extra.is_object());
    CHECK(e.extra.as_object().at("attempted_role").as_string() == "admin");
    CHECK(e.extra.as_object().at("assigned_role").as_string() == "student");
}

TEST_CASE("AuditTrail stores an oversized extra payload as empty and still records the event")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    AuditTrail trail(db, clock);

    AuditEvent e;
    e.type = EventType::AdminAction;
    e.description = "bulk import";
    e.extra = boost::json::object{{"blob", std::string(max_extra_bytes + 1, 'x')}};

    auto id = trail.log(e);

    REQUIRE(id.has_value());
    auto rows = trail.recent(1);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].event.description == "bulk import");
    CHECK(rows[0].event.extra.is_null());
}

TEST_CASE("AuditTrail returns newest first and filters by user")
{
    auto db = test_support::memory_db();
    ManualClock clock;
    AuditTrail trail(db, clock);

    REQUIRE(trail.log(events::login_failed("bob", std::nullopt, "wrong password")));
    clock.advance(std::chrono::seconds(5));
    REQUIRE(trail.log(events::login_failed("carol", std::nullopt, "wrong password")));
    clock.advance(std::chrono::seconds(5));
    REQUIRE(trail.log(events::login_failed("bob", std::nullopt, "unknown user")));

    auto all = trail.recent(10);
    REQUIRE(all.size() == 3);
    CHECK(all[0].event.timestamp > all[2].event.timestamp);

    auto limited = trail.recent(2);
    CHECK(limited.size() == 2);

    auto bobs = trail.for_user("bob", 10);
    REQUIRE(bobs.size() == 2);
    CHECK(bobs[0].event.extra.as_object().at("reason").as_string() == "unknown user");
    CHECK(bobs[1].event.extra.as_object().at("reason").as_string() == "wrong password");
}

TEST_CASE("Stored audit rows cannot be updated")
{
    auto db = test_support::memory_db();
    AuditTrail trail(db);

    REQUIRE(trail.log(events::login_failed("bob", std::nullopt, "wrong password")));
    CHECK_FALSE(db.exec("UPDATE audit_logs SET success = 1;"));
    CHECK(trail.recent(1).at(0).event.success == false);
}

TEST_CASE("Stored audit rows cannot be deleted")
{
    auto db = test_support::memory_db();
    AuditTrail trail(db);

    REQUIRE(trail.log(events::login_failed("bob", std::nullopt, "wrong password")));
    CHECK_FALSE(db.exec("DELETE FROM audit_logs;"));
    CHECK(trail.recent(10).size() == 1);
}

TEST_CASE("Event type and severity names round-trip")
{
    for (auto t : {EventType::LoginSuccess, EventType::LoginFailed, EventType::PasswordChanged,
                   EventType::PrivilegeEscalationAttempt, EventType::AccountCreated, EventType::AccountDeleted,
                   EventType::AdminAction, EventType::AccountLocked, EventType::AccountUnlocked})
    {
        CHECK(parse_event_type(to_string(t)) == t);
    }
    CHECK(to_string(EventType::PrivilegeEscalationAttempt) == "privilege_escalation_attempt");
    CHECK(parse_severity("critical") == Severity::Critical);
    CHECK_FALSE(parse_severity("fatal").has_value());
}

TEST_CASE("access_denied is a warning-level escalation attempt")
{
    auth::Principal student{3, "sam", auth::Role::Student};
    auto e = events::access_denied(student, "user_management", 9, "admin role required");

    CHECK(e.type == EventType::PrivilegeEscalationAttempt);
    CHECK(e.severity == Severity::Warning);
    CHECK(e.actor_user_id == 3);
    CHECK(e.extra.as_object().at("target_user_id").as_int64() == 9);
}
