#pragma once

#include "audit/audit_event.hpp"
#include "auth/account_service.hpp"
#include "auth/errors.hpp"
#include "auth/user_record.hpp"

#include <boost/json.hpp>
#include <string_view>

namespace auth::responses
{

struct Response
{
    int status = 200;
    boost::json::object body;
};

[[nodiscard]] boost::json::object to_json(const TokenPair& pair);
[[nodiscard]] boost::json::object to_json(const AccessGrant& grant);

// Never includes the credential hash.
[[nodiscard]] boost::json::object to_json(const UserRecord& user);

[[nodiscard]] boost::json::object to_json(const audit::StoredEvent& row);

// {"detail": message}, plus "locked_until" for locked accounts.
[[nodiscard]] Response error(const Error& err);

template<class T>
[[nodiscard]] Response render(const Result<T>& result, int ok_status = 200)
{
    if (!result)
    {
        return error(result.error());
    }
    return Response{ok_status, to_json(*result)};
}

// Operations without a payload answer {"message": message}.
[[nodiscard]] Response render_status(const Result<void>& result, std::string_view message);

} // namespace auth::responses
