#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

// Ordered by privilege.
enum class Role : uint8_t
{
    Student = 0,
    Teacher = 1,
    Admin = 2
};

constexpr Role lowest_privilege_role = Role::Student;

[[nodiscard]] std::string_view to_string(Role r);
[[nodiscard]] std::optional<Role> parse_role(std::string_view s);

// The authenticated caller of an operation.
struct Principal
{
    int64_t user_id;
    std::string username;
    Role role;
};

} // namespace auth
