#include "auth/password_policy.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace auth
{

namespace
{

template<class Pred>
bool any_char(std::string_view s, Pred pred)
{
    return std::ranges::any_of(s, [&](unsigned char c) { return pred(c) != 0; });
}

std::unexpected<Error> weak(std::string message)
{
    return std::unexpected(Error::make(Errc::WeakPassword, std::move(message)));
}

} // namespace

Result<void> check_password(std::string_view password)
{
    if (password.empty() || !any_char(password, [](unsigned char c) { return !std::isspace(c); }))
    {
        return weak("Password is required");
    }
    if (password.size() < min_password_length)
    {
        return weak("Password must be at least 8 characters long");
    }
    if (!any_char(password, [](unsigned char c) { return std::isupper(c); }))
    {
        return weak("Password must contain at least one uppercase letter");
    }
    if (!any_char(password, [](unsigned char c) { return std::islower(c); }))
    {
        return weak("Password must contain at least one lowercase letter");
    }
    if (!any_char(password, [](unsigned char c) { return std::isdigit(c); }))
    {
        return weak("Password must contain at least one number");
    }
    return {};
}

Result<void> check_email(std::string_view email)
{
    static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    if (email.size() > max_email_length || !std::regex_match(email.begin(), email.end(), pattern))
    {
        return std::unexpected(Error::make(Errc::InvalidInput, "Invalid email format"));
    }
    return {};
}

Result<void> check_username(std::string_view username)
{
    if (username.size() < 3 || username.size() > max_username_length)
    {
        return std::unexpected(Error::make(Errc::InvalidInput, "Username must be 3 to 50 characters"));
    }
    auto allowed = [](unsigned char c) { return std::isalnum(c) || c == '_' || c == '.' || c == '-'; };
    if (!std::ranges::all_of(username, allowed))
    {
        return std::unexpected(Error::make(Errc::InvalidInput,
                                           "Username may only contain letters, digits, '_', '.' and '-'"));
    }
    return {};
}

} // namespace auth
