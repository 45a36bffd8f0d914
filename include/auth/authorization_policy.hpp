#pragma once

#include "auth/role.hpp"
#include "auth/user_directory.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace auth
{

enum class Resource
{
    Profile,
    Preferences,
    UserManagement
};

// How far a teacher's view of students extends.
enum class RelationshipScope
{
    Unrestricted,   // no assignments recorded yet: every student
    AssignedOnly
};

[[nodiscard]] std::string_view to_string(Resource r);
[[nodiscard]] std::string_view to_string(RelationshipScope s);

struct Decision
{
    bool allowed = false;
    std::string reason;

    explicit operator bool() const { return allowed; }
};

/**
 * Deny-by-default access decisions. Rules, first match wins:
 *   1. admin                      -> allowed on everything
 *   2. actor == target            -> Profile and Preferences
 *   3. teacher acting on student  -> Profile and Preferences, within the
 *                                    teacher's RelationshipScope
 *   4. anything else              -> denied
 */
class AuthorizationPolicy
{
public:
    [[nodiscard]] static Decision check(const Principal& actor,
                                        int64_t target_user_id,
                                        Role target_role,
                                        Resource resource,
                                        RelationshipLookup& relationships);

    [[nodiscard]] static RelationshipScope scope_for(int64_t teacher_id, RelationshipLookup& relationships);

    // Whether a teacher with `scope` may see `student_id`.
    [[nodiscard]] static bool student_visible(int64_t teacher_id, int64_t student_id,
                                              RelationshipScope scope, RelationshipLookup& relationships);

    [[nodiscard]] static bool can_list_users(const Principal& actor);
};

} // namespace auth
