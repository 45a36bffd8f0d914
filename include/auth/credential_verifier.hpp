#pragma once

#include "auth/errors.hpp"

#include <string>
#include <string_view>

namespace auth
{

/**
 * Argon2id password hashing through libsodium. Every hash carries its own
 * random salt and cost parameters in the encoded string, so equal inputs
 * never produce equal outputs.
 */
class CredentialVerifier
{
public:
    // Fails with Errc::EmptyInput for an empty plaintext.
    [[nodiscard]] static Result<std::string> hash(std::string_view plaintext);

    // Never fails loudly: a malformed or foreign hash logs a warning and
    // yields false.
    [[nodiscard]] static bool verify(std::string_view plaintext, std::string_view encoded_hash);
};

} // namespace auth
