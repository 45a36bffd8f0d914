#pragma once

#include "auth/role.hpp"

#include <string>
#include <cstdint>
#include <optional>

namespace auth
{

struct UserRecord
{
    int64_t id = 0;
    std::string username;
    std::optional<std::string> email;
    std::string display_name;
    std::string password_hash;
    Role role = Role::Student;
    bool active = true;
    int64_t created_at = 0;
    int64_t last_login = 0;
};

// Fields supplied when a record is created.
struct NewUser
{
    std::string username;
    std::optional<std::string> email;
    std::string display_name;
    std::string password_hash;
    Role role = Role::Student;
};

} // namespace auth
