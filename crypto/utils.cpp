#include "crypto/utils.hpp"

#include <openssl/rand.h>
#include <cstdint>
#include <format>
#include <vector>

namespace crypto
{

std::optional<std::string> random_hex(size_t n_bytes)
{
    std::vector<uint8_t> buf(n_bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
    {
        return std::nullopt;
    }
    std::string out;
    out.reserve(n_bytes * 2);
    for (auto b : buf)
    {
        out += std::format("{:02x}", b);
    }
    secure_clear(buf);
    return out;
}

} // namespace crypto
