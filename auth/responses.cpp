#include "auth/responses.hpp"
#include "fundamentals/json_utils.hpp"
#include "fundamentals/time_utils.hpp"

namespace auth::responses
{

boost::json::object to_json(const TokenPair& pair)
{
    return boost::json::object{
        {"access_token", pair.access_token},
        {"refresh_token", pair.refresh_token},
        {"token_type", pair.token_type},
    };
}

boost::json::object to_json(const AccessGrant& grant)
{
    return boost::json::object{
        {"access_token", grant.access_token},
        {"token_type", grant.token_type},
    };
}

boost::json::object to_json(const UserRecord& user)
{
    boost::json::object obj{
        {"id", user.id},
        {"username", user.username},
        {"display_name", user.display_name},
        {"user_type", to_string(user.role)},
        {"is_active", user.active},
        {"created_at", time_utils::format_iso(time_utils::from_unix(user.created_at))},
    };
    obj["email"] = user.email ? boost::json::value(*user.email) : boost::json::value(nullptr);
    obj["last_login"] = user.last_login > 0
        ? boost::json::value(time_utils::format_iso(time_utils::from_unix(user.last_login)))
        : boost::json::value(nullptr);
    return obj;
}

boost::json::object to_json(const audit::StoredEvent& row)
{
    const auto& e = row.event;
    auto opt = [](const std::optional<std::string>& s) {
        return s ? boost::json::value(*s) : boost::json::value(nullptr);
    };

    boost::json::object obj{
        {"id", row.id},
        {"timestamp", time_utils::format_iso(e.timestamp)},
        {"event_type", audit::to_string(e.type)},
        {"severity", audit::to_string(e.severity)},
        {"description", e.description},
        {"success", e.success},
        {"additional_data", e.extra},
    };
    obj["user_id"] = e.actor_user_id ? boost::json::value(*e.actor_user_id) : boost::json::value(nullptr);
    obj["username"] = opt(e.actor_username);
    obj["user_type"] = opt(e.actor_role);
    obj["ip_address"] = opt(e.source_address);
    obj["endpoint"] = opt(e.target_endpoint);
    return obj;
}

Response error(const Error& err)
{
    Response resp{http_status(err.code), json_utils::detail_msg(err.message)};
    if (err.locked_until)
    {
        resp.body["locked_until"] = time_utils::format_iso(*err.locked_until);
    }
    return resp;
}

Response render_status(const Result<void>& result, std::string_view message)
{
    if (!result)
    {
        return error(result.error());
    }
    return Response{200, boost::json::object{{"message", message}}};
}

} // namespace auth::responses
