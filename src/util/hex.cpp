#include <sodium.h>

#include "util/hex.hpp"

namespace util
{

std::string to_hex(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return {};
    // sodium_bin2hex writes a trailing NUL
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex)
{
    if (hex.size() % 2)
        return std::nullopt;
    std::vector<std::uint8_t> out(hex.size() / 2);
    if (out.empty())
        return out;
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) !=
            0 ||
        bin_len != out.size() || end != hex.data() + hex.size())
    {
        return std::nullopt;
    }
    return out;
}

}  // namespace util
