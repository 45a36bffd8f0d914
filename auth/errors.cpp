#include "auth/errors.hpp"

namespace auth
{

Error Error::make(Errc code, std::string message)
{
    if (message.empty())
    {
        message = std::string(default_message(code));
    }
    return Error{code, std::move(message), std::nullopt};
}

std::string_view to_string(Errc code)
{
    switch (code)
    {
        case Errc::InvalidCredentials: return "invalid_credentials";
        case Errc::AccountLocked:      return "account_locked";
        case Errc::AccountInactive:    return "account_inactive";
        case Errc::InvalidToken:       return "invalid_token";
        case Errc::TokenExpired:       return "token_expired";
        case Errc::WeakPassword:       return "weak_password";
        case Errc::PasswordMismatch:   return "password_mismatch";
        case Errc::Unauthorized:       return "unauthorized";
        case Errc::NotFound:           return "not_found";
        case Errc::EmptyInput:         return "empty_input";
        case Errc::InvalidInput:       return "invalid_input";
        case Errc::Conflict:           return "conflict";
        case Errc::Internal:           return "internal";
    }
    return "internal";
}

std::string_view default_message(Errc code)
{
    switch (code)
    {
        case Errc::InvalidCredentials: return "Incorrect username or password";
        case Errc::AccountLocked:      return "Account is temporarily locked due to multiple failed login attempts";
        case Errc::AccountInactive:    return "Account is inactive. Please contact an administrator.";
        case Errc::InvalidToken:       return "Could not validate credentials";
        case Errc::TokenExpired:       return "Could not validate credentials";
        case Errc::WeakPassword:       return "Password does not meet strength requirements";
        case Errc::PasswordMismatch:   return "Passwords do not match";
        case Errc::Unauthorized:       return "Not authorized to perform this action";
        case Errc::NotFound:           return "User not found";
        case Errc::EmptyInput:         return "Input must not be empty";
        case Errc::InvalidInput:       return "Invalid input";
        case Errc::Conflict:           return "Already exists";
        case Errc::Internal:           return "Internal error";
    }
    return "Internal error";
}

int http_status(Errc code)
{
    switch (code)
    {
        case Errc::InvalidCredentials:
        case Errc::InvalidToken:
        case Errc::TokenExpired:
            return 401;
        case Errc::AccountLocked:
        case Errc::AccountInactive:
        case Errc::Unauthorized:
            return 403;
        case Errc::NotFound:
            return 404;
        case Errc::WeakPassword:
        case Errc::PasswordMismatch:
        case Errc::EmptyInput:
        case Errc::InvalidInput:
        case Errc::Conflict:
            return 400;
        case Errc::Internal:
            return 500;
    }
    return 500;
}

} // namespace auth
