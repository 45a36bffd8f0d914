#pragma once

#include "fundamentals/time_utils.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

enum class Errc
{
    InvalidCredentials,
    AccountLocked,
    AccountInactive,
    InvalidToken,
    TokenExpired,
    WeakPassword,
    PasswordMismatch,
    Unauthorized,
    NotFound,
    EmptyInput,
    InvalidInput,
    Conflict,
    Internal
};

/**
 * Caller-facing failure. `message` is stable and generic enough to return to
 * a client as is; the precise reason, where one exists, goes to the audit
 * trail instead.
 */
struct Error
{
    Errc code;
    std::string message;
    std::optional<time_utils::TimePoint> locked_until{};

    [[nodiscard]] static Error make(Errc code, std::string message = {});
};

template<class T>
using Result = std::expected<T, Error>;

[[nodiscard]] std::string_view to_string(Errc code);

// Default message for a code when the caller supplies none.
[[nodiscard]] std::string_view default_message(Errc code);

// Status code of the conceptual HTTP contract.
[[nodiscard]] int http_status(Errc code);

} // namespace auth
