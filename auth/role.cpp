#include "auth/role.hpp"

namespace auth
{

std::string_view to_string(Role r)
{
    switch (r)
    {
        case Role::Student: return "student";
        case Role::Teacher: return "teacher";
        case Role::Admin:   return "admin";
    }
    return "student";
}

std::optional<Role> parse_role(std::string_view s)
{
    if (s == "student") return Role::Student;
    if (s == "teacher") return Role::Teacher;
    if (s == "admin")   return Role::Admin;
    return std::nullopt;
}

} // namespace auth
