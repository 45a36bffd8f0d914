#include "audit/audit_trail.hpp"
#include "auth/account_service.hpp"
#include "auth/lockout_tracker.hpp"
#include "auth/token_service.hpp"
#include "auth/user_db.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "storage/database.hpp"

#include <charconv>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace
{

// Acts for whoever runs the tool on the database host.
const auth::Principal system_admin{0, "system", auth::Role::Admin};

void print_usage(const char* prog)
{
    std::println("Usage: {} <command> [args]", prog);
    std::println("Commands:");
    std::println("  add <username> <password> <role>  Create user (student, teacher, admin)");
    std::println("  list                              List all users");
    std::println("  disable <username>                Deactivate user");
    std::println("  enable <username>                 Reactivate user");
    std::println("  reset <username> <password>       Reset password");
    std::println("  unlock <username>                 Clear failed login attempts");
    std::println("  audit [limit]                     Show recent audit events");
    std::println("  assign <teacher> <student>        Assign a student to a teacher");
    std::println("  gen-secret                        Print a new token signing secret");
}

struct Services
{
    auth::UserDB& users;
    auth::LockoutTracker& lockout;
    audit::AuditTrail& trail;
    auth::AccountService& accounts;
};

int fail(const auth::Error& err)
{
    std::println(stderr, "Error: {}", err.message);
    return 1;
}

std::optional<auth::UserRecord> lookup(Services& s, std::string_view username)
{
    auto rec = s.users.find_by_username(username);
    if (!rec)
    {
        std::println(stderr, "User '{}' not found", username);
    }
    return rec;
}

int cmd_add(Services& s, std::string_view user, std::string_view pass, std::string_view role)
{
    auth::CreateUserRequest req{
        std::string(user), std::string(pass), std::string(pass), std::nullopt, std::string(user), std::string(role),
    };
    auto rec = s.accounts.admin_create_user(system_admin, req);
    if (!rec)
    {
        return fail(rec.error());
    }
    std::println("User '{}' created with id {} ({})", rec->username, rec->id, auth::to_string(rec->role));
    return 0;
}

int cmd_list(Services& s)
{
    auto users = s.accounts.visible_users(system_admin);
    if (!users)
    {
        return fail(users.error());
    }
    if (users->empty())
    {
        std::println("No users found");
        return 0;
    }

    std::println("{:<6} {:<20} {:<8} {:<10} {}", "ID", "Username", "Role", "Status", "Last Login");
    std::println("{}", std::string(70, '-'));

    for (const auto& u : *users)
    {
        auto status = u.active ? "active" : "disabled";
        auto locked = s.lockout.is_locked(u.username);
        auto last = u.last_login == 0 ? std::string("never")
                                       : time_utils::format_utc(time_utils::from_unix(u.last_login));
        std::println("{:<6} {:<20} {:<8} {:<10} {}{}", u.id, u.username, auth::to_string(u.role),
                     status, last, locked.locked ? " [locked]" : "");
    }
    return 0;
}

int cmd_set_active(Services& s, std::string_view user, bool active)
{
    auto rec = lookup(s, user);
    if (!rec)
    {
        return 1;
    }
    if (auto ok = s.accounts.admin_set_active(system_admin, rec->id, active); !ok)
    {
        return fail(ok.error());
    }
    std::println("User '{}' {}", user, active ? "enabled" : "disabled");
    return 0;
}

int cmd_reset(Services& s, std::string_view user, std::string_view pass)
{
    auto rec = lookup(s, user);
    if (!rec)
    {
        return 1;
    }
    if (auto ok = s.accounts.admin_reset_password(system_admin, rec->id, pass); !ok)
    {
        return fail(ok.error());
    }
    std::println("Password reset for '{}'", user);
    return 0;
}

int cmd_unlock(Services& s, std::string_view user)
{
    auto removed = s.accounts.admin_unlock(system_admin, user);
    if (!removed)
    {
        return fail(removed.error());
    }
    std::println("User '{}' {}", user, *removed ? "unlocked" : "had no failed attempts");
    return 0;
}

int cmd_audit(Services& s, size_t limit)
{
    auto rows = s.trail.recent(limit);
    if (rows.empty())
    {
        std::println("No audit events");
        return 0;
    }
    for (const auto& row : rows)
    {
        const auto& e = row.event;
        std::println("{:>6} {} {:<8} {:<28} {:<16} {}",
                     row.id, time_utils::format_utc(e.timestamp), audit::to_string(e.severity),
                     audit::to_string(e.type), e.actor_username.value_or("-"), e.description);
    }
    return 0;
}

int cmd_assign(Services& s, std::string_view teacher, std::string_view student)
{
    auto t = lookup(s, teacher);
    auto st = lookup(s, student);
    if (!t || !st)
    {
        return 1;
    }
    if (t->role != auth::Role::Teacher || st->role != auth::Role::Student)
    {
        std::println(stderr, "'{}' must be a teacher and '{}' a student", teacher, student);
        return 1;
    }
    if (!s.users.assign(t->id, st->id))
    {
        std::println(stderr, "Failed to assign '{}' to '{}'", student, teacher);
        return 1;
    }
    s.trail.log(audit::events::admin_action(
        system_admin, "assign_student",
        std::format("Student {} assigned to teacher {}", st->username, t->username), std::nullopt));
    std::println("Student '{}' assigned to teacher '{}'", student, teacher);
    return 0;
}

int cmd_gen_secret()
{
    auto secret = auth::TokenService::generate_secret();
    if (!secret)
    {
        std::println(stderr, "Random number generator failure");
        return 1;
    }
    std::println("{}", *secret);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    if (cmd == "gen-secret")
    {
        return cmd_gen_secret();
    }

    auto cfg = Config::load_or_defaults("warden.json");
    const auto& log_cfg = cfg.logging();
    if (auto ok = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console); !ok)
    {
        std::println(stderr, "{}", ok.error());
        return 1;
    }

    auto db_res = storage::Database::open(cfg.storage().db_path);
    if (!db_res)
    {
        std::println(stderr, "Failed to open {}: {}", cfg.storage().db_path, db_res.error());
        return 1;
    }
    auto& db = *db_res;
    if (!db.init_schema())
    {
        std::println(stderr, "Failed to initialise schema: {}", db.last_error());
        return 1;
    }

    auto tokens = auth::TokenService::create(cfg.tokens(), cfg.environment());
    if (!tokens)
    {
        std::println(stderr, "{}", tokens.error());
        return 1;
    }

    auth::UserDB users(db);
    auth::LockoutTracker lockout(db, cfg.lockout());
    audit::AuditTrail trail(db);
    auth::AccountService accounts(users, users, lockout, trail, *tokens);
    Services s{users, lockout, trail, accounts};

    if (cmd == "add" && argc == 5)
    {
        return cmd_add(s, argv[2], argv[3], argv[4]);
    }
    else if (cmd == "list")
    {
        return cmd_list(s);
    }
    else if (cmd == "disable" && argc == 3)
    {
        return cmd_set_active(s, argv[2], false);
    }
    else if (cmd == "enable" && argc == 3)
    {
        return cmd_set_active(s, argv[2], true);
    }
    else if (cmd == "reset" && argc == 4)
    {
        return cmd_reset(s, argv[2], argv[3]);
    }
    else if (cmd == "unlock" && argc == 3)
    {
        return cmd_unlock(s, argv[2]);
    }
    else if (cmd == "audit" && argc <= 3)
    {
        size_t limit = 20;
        if (argc == 3)
        {
            std::string_view arg = argv[2];
            auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), limit);
            if (ec != std::errc{} || ptr != arg.data() + arg.size() || limit == 0)
            {
                std::println(stderr, "Invalid limit '{}'", arg);
                return 1;
            }
        }
        return cmd_audit(s, limit);
    }
    else if (cmd == "assign" && argc == 4)
    {
        return cmd_assign(s, argv[2], argv[3]);
    }
    else
    {
        print_usage(argv[0]);
        return 1;
    }
}
