#include "crypto/hmac_sha256.hpp"
#include "crypto/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>

namespace crypto
{

std::optional<HmacSha256::digest_t> HmacSha256::sign(std::span<const uint8_t> key,
                                                     std::string_view message)
{
    digest_t out{};
    unsigned int out_len = 0;
    auto* res = HMAC(EVP_sha256(),
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     out.data(), std::addressof(out_len));
    if (!res || out_len != digest_sz)
    {
        return std::nullopt;
    }
    return out;
}

bool HmacSha256::verify(std::span<const uint8_t> key,
                        std::string_view message,
                        std::span<const uint8_t> mac)
{
    if (mac.size() != digest_sz)
    {
        return false;
    }
    auto expected = sign(key, message);
    if (!expected)
    {
        return false;
    }
    bool ok = CRYPTO_memcmp(expected->data(), mac.data(), digest_sz) == 0;
    secure_clear(*expected);
    return ok;
}

namespace base64url
{

std::string encode(std::span<const uint8_t> data)
{
    if (data.empty())
    {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    std::ranges::replace(out, '+', '-');
    std::ranges::replace(out, '/', '_');
    return out;
}

std::string encode(std::string_view data)
{
    return encode(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::optional<std::string> decode(std::string_view text)
{
    while (!text.empty() && text.back() == '=')
    {
        text.remove_suffix(1);
    }
    if (text.empty())
    {
        return std::string{};
    }
    if (text.size() % 4 == 1)
    {
        return std::nullopt;
    }

    std::string std_b64;
    std_b64.reserve(text.size() + 3);
    for (char ch : text)
    {
        if (ch == '+' || ch == '/')
        {
            return std::nullopt; // standard alphabet is not base64url
        }
        std_b64 += (ch == '-') ? '+' : (ch == '_') ? '/' : ch;
    }
    size_t pad = (4 - std_b64.size() % 4) % 4;
    std_b64.append(pad, '=');

    std::string out(3 * std_b64.size() / 4, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(std_b64.data()),
                            static_cast<int>(std_b64.size()));
    if (n < 0)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the bytes produced by padding characters.
    out.resize(static_cast<size_t>(n) - pad);

    // Only the canonical spelling is accepted: the unused low bits of the
    // final character must be zero.
    if (encode(std::string_view(out)) != text)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace base64url

} // namespace crypto
