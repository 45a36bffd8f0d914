#include "auth/authorization_policy.hpp"

namespace auth
{

std::string_view to_string(Resource r)
{
    switch (r)
    {
        case Resource::Profile: return "profile";
        case Resource::Preferences: return "preferences";
        case Resource::UserManagement: return "user_management";
    }
    return "unknown";
}

std::string_view to_string(RelationshipScope s)
{
    return s == RelationshipScope::Unrestricted ? "unrestricted" : "assigned_only";
}

RelationshipScope AuthorizationPolicy::scope_for(int64_t teacher_id, RelationshipLookup& relationships)
{
    return relationships.assignment_count(teacher_id) == 0 ? RelationshipScope::Unrestricted
                                                           : RelationshipScope::AssignedOnly;
}

bool AuthorizationPolicy::student_visible(int64_t teacher_id, int64_t student_id,
                                          RelationshipScope scope, RelationshipLookup& relationships)
{
    return scope == RelationshipScope::Unrestricted || relationships.is_assigned(teacher_id, student_id);
}

Decision AuthorizationPolicy::check(const Principal& actor,
                                    int64_t target_user_id,
                                    Role target_role,
                                    Resource resource,
                                    RelationshipLookup& relationships)
{
    if (actor.role == Role::Admin)
    {
        return {true, "admin"};
    }

    const bool personal = resource == Resource::Profile || resource == Resource::Preferences;
    if (!personal)
    {
        return {false, "admin role required"};
    }

    if (actor.user_id == target_user_id)
    {
        return {true, "self"};
    }

    if (actor.role == Role::Teacher && target_role == Role::Student)
    {
        auto scope = scope_for(actor.user_id, relationships);
        if (student_visible(actor.user_id, target_user_id, scope, relationships))
        {
            return {true, scope == RelationshipScope::Unrestricted ? "teacher, no assignments recorded"
                                                                   : "teacher, assigned student"};
        }
        return {false, "student not assigned to teacher"};
    }

    return {false, "no rule grants access"};
}

bool AuthorizationPolicy::can_list_users(const Principal& actor)
{
    return actor.role == Role::Admin || actor.role == Role::Teacher;
}

} // namespace auth
