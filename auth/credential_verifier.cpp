#include "auth/credential_verifier.hpp"
#include "logger.hpp"

#include <sodium.h>
#include <array>

namespace auth
{

namespace
{

bool sodium_ready()
{
    static const bool ok = sodium_init() >= 0;
    return ok;
}

} // namespace

Result<std::string> CredentialVerifier::hash(std::string_view plaintext)
{
    if (plaintext.empty())
    {
        return std::unexpected(Error::make(Errc::EmptyInput, "Password cannot be empty"));
    }
    if (!sodium_ready())
    {
        LOG_ERROR("Failed to initialize libsodium");
        return std::unexpected(Error::make(Errc::Internal));
    }

    std::array<char, crypto_pwhash_STRBYTES> encoded{};
    int result = crypto_pwhash_str(
        encoded.data(),
        plaintext.data(), plaintext.size(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE
    );

    if (result != 0)
    {
        LOG_ERROR("Password hashing failed (out of memory?)");
        return std::unexpected(Error::make(Errc::Internal));
    }

    return std::string(encoded.data());
}

bool CredentialVerifier::verify(std::string_view plaintext, std::string_view encoded_hash)
{
    if (!sodium_ready())
    {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    // crypto_pwhash_str_verify reads a NUL-terminated string of bounded size.
    if (encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES ||
        !encoded_hash.starts_with("$argon2"))
    {
        LOG_WARN("Password verification failed: malformed credential hash");
        return false;
    }

    std::array<char, crypto_pwhash_STRBYTES> buf{};
    encoded_hash.copy(buf.data(), encoded_hash.size());

    return crypto_pwhash_str_verify(buf.data(), plaintext.data(), plaintext.size()) == 0;
}

} // namespace auth
