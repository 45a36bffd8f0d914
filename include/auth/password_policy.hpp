#pragma once

#include "auth/errors.hpp"

#include <string_view>

namespace auth
{

constexpr size_t min_password_length = 8;
constexpr size_t max_username_length = 50;
constexpr size_t max_email_length = 254;

// Errc::WeakPassword naming the first rule that fails:
// non-blank, length, uppercase, lowercase, digit.
[[nodiscard]] Result<void> check_password(std::string_view password);

// At most max_email_length characters, then a shape check.
[[nodiscard]] Result<void> check_email(std::string_view email);

// 3..50 characters of [A-Za-z0-9_.-].
[[nodiscard]] Result<void> check_username(std::string_view username);

} // namespace auth
