#pragma once
#include <openssl/crypto.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size());
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

// Hex of `n_bytes` from the OpenSSL CSPRNG; nullopt if the generator fails.
[[nodiscard]] std::optional<std::string> random_hex(size_t n_bytes);

} // namespace crypto
