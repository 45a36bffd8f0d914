#include <catch2/catch_test_macros.hpp>

#include "auth/account_service.hpp"
#include "auth/credential_verifier.hpp"
#include "auth/password_policy.hpp"
#include "auth/responses.hpp"
#include "auth/user_db.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <string>

using namespace auth;
using namespace std::chrono_literals;
using test_support::ManualClock;

namespace
{

TokenService make_tokens(const ManualClock& clock)
{
    Config::TokensCfg cfg;
    cfg.secret = "account-service-test-secret-0123456789abcdef";
    auto svc = TokenService::create(cfg, "development", clock);
    REQUIRE(svc.has_value());
    return std::move(*svc);
}

struct Harness
{
    storage::Database db = test_support::memory_db();
    ManualClock clock;
    UserDB users{db};
    LockoutTracker lockout{db, Config::LockoutCfg{}, clock};
    audit::AuditTrail trail{db, clock};
    TokenService tokens = make_tokens(clock);
    AccountService accounts{users, users, lockout, trail, tokens, clock};
    Principal admin{0, "root", Role::Admin};

    Harness()
    {
        admin.user_id = add_user("root", "RootPass1", Role::Admin);
    }

    int64_t add_user(const std::string& name, std::string_view password, Role role)
    {
        auto hash = CredentialVerifier::hash(password);
        REQUIRE(hash.has_value());
        auto id = users.create_user(NewUser{name, std::nullopt, "", *hash, role});
        REQUIRE(id.has_value());
        return *id;
    }

    Result<TokenPair> login(const std::string& name, const std::string& password)
    {
        return accounts.login(LoginRequest{name, password, std::string("203.0.113.9")});
    }

    size_t count_events(audit::EventType type)
    {
        auto rows = trail.recent(1000);
        return static_cast<size_t>(std::ranges::count_if(rows, [&](const audit::StoredEvent& r) {
            return r.event.type == type;
        }));
    }
};

RegisterRequest registration(std::string name, std::string password)
{
    RegisterRequest req;
    req.username = std::move(name);
    req.password = std::move(password);
    return req;
}

}

TEST_CASE("Register, lock out, unlock and log in again")
{
    Harness h;

    auto reg = registration("bob", "Secret1A");
    reg.email = "bob@example.com";
    auto bob = h.accounts.register_user(reg);
    REQUIRE(bob.has_value());
    CHECK(bob->role == Role::Student);
    CHECK(bob->email == "bob@example.com");

    auto first = h.login("bob", "Secret1A");
    REQUIRE(first.has_value());
    CHECK(first->token_type == "bearer");
    auto claims = h.tokens.validate_access(first->access_token);
    REQUIRE(claims.has_value());
    CHECK(claims->subject == "bob");
    CHECK(claims->role == Role::Student);
    CHECK(h.tokens.validate_refresh(first->refresh_token).has_value());

    for (int i = 0; i < 4; ++i)
    {
        auto res = h.login("bob", "wrong-password");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().code == Errc::InvalidCredentials);
        CHECK(res.error().message == "Incorrect username or password");
    }

    auto fifth = h.login("bob", "wrong-password");
    REQUIRE_FALSE(fifth.has_value());
    CHECK(fifth.error().code == Errc::AccountLocked);
    REQUIRE(fifth.error().locked_until.has_value());
    CHECK(*fifth.error().locked_until == h.clock.now() + 15min);
    CHECK(fifth.error().message.find(time_utils::format_utc(h.clock.now() + 15min)) != std::string::npos);
    CHECK(h.count_events(audit::EventType::AccountLocked) == 1);

    h.clock.advance(2min);
    auto still_locked = h.login("bob", "Secret1A");
    REQUIRE_FALSE(still_locked.has_value());
    CHECK(still_locked.error().code == Errc::AccountLocked);

    auto unlocked = h.accounts.admin_unlock(h.admin, "bob");
    REQUIRE(unlocked.has_value());
    CHECK(*unlocked);
    CHECK(h.count_events(audit::EventType::AccountUnlocked) == 1);

    auto again = h.login("bob", "Secret1A");
    REQUIRE(again.has_value());
    CHECK_FALSE(h.lockout.status("bob").has_value());
}

TEST_CASE("Public registration downgrades a requested elevated role")
{
    Harness h;

    auto req = registration("mallory", "Secret1A");
    req.requested_role = "admin";
    auto rec = h.accounts.register_user(req);

    REQUIRE(rec.has_value());
    CHECK(rec->role == Role::Student);
    CHECK(h.users.find_by_username("mallory")->role == Role::Student);

    auto rows = h.trail.for_user("mallory", 10);
    auto escalation = std::ranges::find_if(rows, [](const audit::StoredEvent& r) {
        return r.event.type == audit::EventType::PrivilegeEscalationAttempt;
    });
    REQUIRE(escalation != rows.end());
    CHECK(escalation->event.severity == audit::Severity::Critical);
    CHECK(h.count_events(audit::EventType::PrivilegeEscalationAttempt) == 1);
    CHECK(h.count_events(audit::EventType::AccountCreated) == 1);
}

TEST_CASE("Requesting the student role is not an escalation")
{
    Harness h;

    auto req = registration("sam", "Secret1A");
    req.requested_role = "student";
    REQUIRE(h.accounts.register_user(req).has_value());
    CHECK(h.count_events(audit::EventType::PrivilegeEscalationAttempt) == 0);
}

TEST_CASE("Registration validation errors are reported and not audited")
{
    Harness h;
    REQUIRE(h.accounts.register_user(registration("bob", "Secret1A")).has_value());
    auto before = h.trail.recent(1000).size();

    CHECK(h.accounts.register_user(registration("bob", "Secret1A")).error().code == Errc::Conflict);
    CHECK(h.accounts.register_user(registration("b", "Secret1A")).error().code == Errc::InvalidInput);
    CHECK(h.accounts.register_user(registration("carol", "short")).error().code == Errc::WeakPassword);

    auto bad_email = registration("carol", "Secret1A");
    bad_email.email = "carol-at-example";
    CHECK(h.accounts.register_user(bad_email).error().code == Errc::InvalidInput);

    auto dup_email = registration("dave", "Secret1A");
    dup_email.email = "shared@example.com";
    REQUIRE(h.accounts.register_user(dup_email).has_value());
    ++before;
    auto dup_email2 = registration("erin", "Secret1A");
    dup_email2.email = "shared@example.com";
    CHECK(h.accounts.register_user(dup_email2).error().code == Errc::Conflict);

    CHECK(h.trail.recent(1000).size() == before);
}

TEST_CASE("Unknown users get the generic error and still accumulate failures")
{
    Harness h;

    auto res = h.login("ghost", "Whatever1");
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == Errc::InvalidCredentials);
    CHECK(res.error().message == "Incorrect username or password");

    auto st = h.lockout.status("ghost");
    REQUIRE(st.has_value());
    CHECK(st->attempt_count == 1);
    CHECK(st->source_address == "203.0.113.9");
}

TEST_CASE("Inactive accounts cannot log in")
{
    Harness h;
    auto id = h.add_user("ivan", "Secret1A", Role::Student);
    REQUIRE(h.accounts.admin_set_active(h.admin, id, false).has_value());

    auto res = h.login("ivan", "Secret1A");
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == Errc::AccountInactive);
    CHECK_FALSE(h.lockout.status("ivan").has_value());

    REQUIRE(h.accounts.admin_set_active(h.admin, id, true).has_value());
    CHECK(h.login("ivan", "Secret1A").has_value());
}

TEST_CASE("A lock expires on its own and success resets the count")
{
    Harness h;
    h.add_user("bob", "Secret1A", Role::Student);

    for (int i = 0; i < 5; ++i)
    {
        (void)h.login("bob", "nope");
    }
    REQUIRE(h.lockout.is_locked("bob").locked);

    h.clock.advance(15min);
    REQUIRE(h.login("bob", "Secret1A").has_value());
    CHECK_FALSE(h.lockout.status("bob").has_value());

    (void)h.login("bob", "nope");
    CHECK(h.lockout.status("bob")->attempt_count == 1);
}

TEST_CASE("Refresh mints an access token with the current role")
{
    Harness h;
    auto id = h.add_user("tess", "Secret1A", Role::Student);
    auto pair = h.login("tess", "Secret1A");
    REQUIRE(pair.has_value());

    REQUIRE(h.accounts.admin_set_role(h.admin, id, Role::Teacher).has_value());

    auto grant = h.accounts.refresh(pair->refresh_token);
    REQUIRE(grant.has_value());
    CHECK(grant->token_type == "bearer");
    auto claims = h.tokens.validate_access(grant->access_token);
    REQUIRE(claims.has_value());
    CHECK(claims->role == Role::Teacher);
}

TEST_CASE("Refresh rejects access tokens, expired tokens and deactivated users")
{
    Harness h;
    auto id = h.add_user("tess", "Secret1A", Role::Student);
    auto pair = h.login("tess", "Secret1A");
    REQUIRE(pair.has_value());

    CHECK(h.accounts.refresh(pair->access_token).error().code == Errc::InvalidToken);
    CHECK(h.accounts.refresh("garbage").error().code == Errc::InvalidToken);

    REQUIRE(h.accounts.admin_set_active(h.admin, id, false).has_value());
    CHECK(h.accounts.refresh(pair->refresh_token).error().code == Errc::AccountInactive);

    REQUIRE(h.accounts.admin_set_active(h.admin, id, true).has_value());
    h.clock.advance(std::chrono::days(7));
    CHECK(h.accounts.refresh(pair->refresh_token).error().code == Errc::TokenExpired);
}

TEST_CASE("authenticate resolves a bearer token to the stored principal")
{
    Harness h;
    auto id = h.add_user("tess", "Secret1A", Role::Teacher);
    auto pair = h.login("tess", "Secret1A");
    REQUIRE(pair.has_value());

    auto who = h.accounts.authenticate("Bearer " + pair->access_token);
    REQUIRE(who.has_value());
    CHECK(who->user_id == id);
    CHECK(who->username == "tess");
    CHECK(who->role == Role::Teacher);

    CHECK(h.accounts.authenticate(pair->access_token).has_value());
    CHECK(h.accounts.authenticate("Bearer " + pair->refresh_token).error().code == Errc::InvalidToken);
    CHECK(h.accounts.authenticate("").error().code == Errc::InvalidToken);

    REQUIRE(h.accounts.admin_set_active(h.admin, id, false).has_value());
    CHECK(h.accounts.authenticate(pair->access_token).error().code == Errc::AccountInactive);

    REQUIRE(h.accounts.admin_delete_user(h.admin, id).has_value());
    CHECK(h.accounts.authenticate(pair->access_token).error().code == Errc::InvalidToken);
}

TEST_CASE("change_password verifies the current password, then strength, then confirmation")
{
    Harness h;
    auto id = h.add_user("bob", "Secret1A", Role::Student);
    Principal bob{id, "bob", Role::Student};

    auto wrong = h.accounts.change_password(bob, {"NotMine1", "NewSecret2", "NewSecret2"});
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error().code == Errc::InvalidCredentials);

    auto weak = h.accounts.change_password(bob, {"Secret1A", "weak", "different"});
    REQUIRE_FALSE(weak.has_value());
    CHECK(weak.error().code == Errc::WeakPassword);

    auto mismatch = h.accounts.change_password(bob, {"Secret1A", "NewSecret2", "NewSecret3"});
    REQUIRE_FALSE(mismatch.has_value());
    CHECK(mismatch.error().code == Errc::PasswordMismatch);

    REQUIRE(h.accounts.change_password(bob, {"Secret1A", "NewSecret2", "NewSecret2"}).has_value());
    CHECK(h.count_events(audit::EventType::PasswordChanged) == 1);
    CHECK_FALSE(h.login("bob", "Secret1A").has_value());
    CHECK(h.login("bob", "NewSecret2").has_value());
}

TEST_CASE("admin_create_user requires an admin and a matching confirmation")
{
    Harness h;
    auto sid = h.add_user("sam", "Secret1A", Role::Student);
    Principal sam{sid, "sam", Role::Student};

    CreateUserRequest req{"tina", "Teach3rPass", "Teach3rPass", "tina@school.example.org", "Tina T", "teacher"};

    auto denied = h.accounts.admin_create_user(sam, req);
    REQUIRE_FALSE(denied.has_value());
    CHECK(denied.error().code == Errc::Unauthorized);
    CHECK(h.count_events(audit::EventType::PrivilegeEscalationAttempt) == 1);

    auto mismatch = req;
    mismatch.confirm_password = "Teach3rPasz";
    CHECK(h.accounts.admin_create_user(h.admin, mismatch).error().code == Errc::PasswordMismatch);

    auto bad_role = req;
    bad_role.role = "principal";
    CHECK(h.accounts.admin_create_user(h.admin, bad_role).error().code == Errc::InvalidInput);

    auto created = h.accounts.admin_create_user(h.admin, req);
    REQUIRE(created.has_value());
    CHECK(created->role == Role::Teacher);
    CHECK(created->display_name == "Tina T");
    CHECK(h.login("tina", "Teach3rPass").has_value());
}

TEST_CASE("admin_unlock is admin-only, idempotent and needs a known user")
{
    Harness h;
    auto sid = h.add_user("sam", "Secret1A", Role::Student);
    Principal sam{sid, "sam", Role::Student};

    CHECK(h.accounts.admin_unlock(sam, "sam").error().code == Errc::Unauthorized);
    CHECK(h.accounts.admin_unlock(h.admin, "nobody").error().code == Errc::NotFound);

    auto none = h.accounts.admin_unlock(h.admin, "sam");
    REQUIRE(none.has_value());
    CHECK_FALSE(*none);
}

TEST_CASE("authorize audits denials and reports missing targets")
{
    Harness h;
    auto a = h.add_user("sam", "Secret1A", Role::Student);
    auto b = h.add_user("sue", "Secret1A", Role::Student);
    auto t = h.add_user("ms_t", "Secret1A", Role::Teacher);
    Principal sam{a, "sam", Role::Student};
    Principal teacher{t, "ms_t", Role::Teacher};

    CHECK(h.accounts.authorize(sam, Resource::Profile, a).has_value());
    CHECK(h.accounts.authorize(teacher, Resource::Profile, b).has_value());

    auto denied = h.accounts.authorize(sam, Resource::Profile, b);
    REQUIRE_FALSE(denied.has_value());
    CHECK(denied.error().code == Errc::Unauthorized);

    auto rows = h.trail.for_user("sam", 10);
    REQUIRE_FALSE(rows.empty());
    CHECK(rows[0].event.type == audit::EventType::PrivilegeEscalationAttempt);
    CHECK(rows[0].event.severity == audit::Severity::Warning);

    CHECK(h.accounts.authorize(h.admin, Resource::UserManagement, 9999).error().code == Errc::NotFound);
}

TEST_CASE("Admin role changes and deletions cannot target the acting admin")
{
    Harness h;
    CHECK(h.accounts.admin_set_role(h.admin, h.admin.user_id, Role::Student).error().code == Errc::InvalidInput);
    CHECK(h.accounts.admin_delete_user(h.admin, h.admin.user_id).error().code == Errc::InvalidInput);
    CHECK(h.accounts.admin_set_active(h.admin, h.admin.user_id, false).error().code == Errc::InvalidInput);

    auto id = h.add_user("temp", "Secret1A", Role::Student);
    REQUIRE(h.accounts.admin_delete_user(h.admin, id).has_value());
    CHECK_FALSE(h.users.find_by_id(id).has_value());

    auto rows = h.trail.recent(1);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].event.type == audit::EventType::AccountDeleted);
    CHECK(rows[0].event.severity == audit::Severity::Warning);
    CHECK(h.accounts.admin_delete_user(h.admin, id).error().code == Errc::NotFound);
}

TEST_CASE("admin_reset_password replaces the credential")
{
    Harness h;
    auto id = h.add_user("bob", "Secret1A", Role::Student);

    CHECK(h.accounts.admin_reset_password(h.admin, id, "weak").error().code == Errc::WeakPassword);
    REQUIRE(h.accounts.admin_reset_password(h.admin, id, "Fresh4Start").has_value());
    CHECK(h.login("bob", "Fresh4Start").has_value());
}

TEST_CASE("visible_users follows role and relationship scope")
{
    Harness h;
    auto t = h.add_user("ms_t", "Secret1A", Role::Teacher);
    auto s1 = h.add_user("sam", "Secret1A", Role::Student);
    auto s2 = h.add_user("sue", "Secret1A", Role::Student);
    Principal teacher{t, "ms_t", Role::Teacher};
    Principal sam{s1, "sam", Role::Student};

    auto all = h.accounts.visible_users(h.admin);
    REQUIRE(all.has_value());
    CHECK(all->size() == 4);

    auto teachers = h.accounts.visible_users(h.admin, Role::Teacher);
    REQUIRE(teachers.has_value());
    CHECK(teachers->size() == 1);

    auto before = h.accounts.visible_users(teacher);
    REQUIRE(before.has_value());
    CHECK(before->size() == 2);

    REQUIRE(h.users.assign(t, s2));
    auto after = h.accounts.visible_users(teacher);
    REQUIRE(after.has_value());
    REQUIRE(after->size() == 1);
    CHECK(after->front().username == "sue");

    CHECK(h.accounts.visible_users(teacher, Role::Admin).error().code == Errc::Unauthorized);
    CHECK(h.accounts.visible_users(sam).error().code == Errc::Unauthorized);
}

TEST_CASE("Responses render the wire contract")
{
    Harness h;
    h.add_user("bob", "Secret1A", Role::Student);

    auto ok = responses::render(h.login("bob", "Secret1A"));
    CHECK(ok.status == 200);
    CHECK(ok.body.at("token_type").as_string() == "bearer");
    CHECK(ok.body.contains("access_token"));
    CHECK(ok.body.contains("refresh_token"));

    auto bad = responses::render(h.login("bob", "wrong"));
    CHECK(bad.status == 401);
    CHECK(bad.body.at("detail").as_string() == "Incorrect username or password");

    for (int i = 0; i < 4; ++i)
    {
        (void)h.login("bob", "wrong");
    }
    auto locked = responses::render(h.login("bob", "Secret1A"));
    CHECK(locked.status == 403);
    CHECK(locked.body.contains("locked_until"));

    auto user = responses::to_json(*h.users.find_by_username("bob"));
    CHECK_FALSE(user.contains("password_hash"));
    CHECK(user.at("user_type").as_string() == "student");

    auto status = responses::render_status(Result<void>{}, "Password changed successfully");
    CHECK(status.status == 200);
    CHECK(status.body.at("message").as_string() == "Password changed successfully");
}

TEST_CASE("Registration rejects an oversized email before matching it")
{
    Harness h;

    auto req = registration("longmail", "Secret1A");
    req.email = std::string(200000, 'a') + "@example.com";
    auto res = h.accounts.register_user(req);

    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == Errc::InvalidInput);
    CHECK_FALSE(h.users.find_by_username("longmail").has_value());
}

TEST_CASE("Successful login stamps last_login from the service clock")
{
    Harness h;
    h.add_user("bob", "Secret1A", Role::Student);
    h.clock.advance(90min);

    REQUIRE(h.login("bob", "Secret1A").has_value());
    CHECK(h.users.find_by_username("bob")->last_login == time_utils::to_unix(h.clock.now()));
}

TEST_CASE("Oversized usernames are refused without a lockout record")
{
    Harness h;
    const std::string name(max_username_length + 1, 'x');

    auto res = h.login(name, "Secret1A");
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == Errc::InvalidCredentials);
    CHECK_FALSE(h.lockout.status(name).has_value());

    const std::string longest(max_username_length, 'x');
    (void)h.login(longest, "Secret1A");
    CHECK(h.lockout.status(longest).has_value());
}
