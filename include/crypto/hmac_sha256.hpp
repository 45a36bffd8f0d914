#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace crypto
{

class HmacSha256
{
public:
    static constexpr size_t digest_sz = 32;
    using digest_t = std::array<uint8_t, digest_sz>;

    [[nodiscard]] static std::optional<digest_t> sign(std::span<const uint8_t> key,
                                                      std::string_view message);

    // Constant-time comparison of the expected MAC against `mac`.
    [[nodiscard]] static bool verify(std::span<const uint8_t> key,
                                     std::string_view message,
                                     std::span<const uint8_t> mac);
};

namespace base64url
{

// RFC 4648 section 5 alphabet, no padding.
[[nodiscard]] std::string encode(std::span<const uint8_t> data);
[[nodiscard]] std::string encode(std::string_view data);

// Accepts input with or without trailing '=' padding.
[[nodiscard]] std::optional<std::string> decode(std::string_view text);

} // namespace base64url

} // namespace crypto
