#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util
{

// Lowercase hex, as used for peer ids, fragment group keys and fingerprints.
std::string to_hex(const std::uint8_t *data, std::size_t len);

inline std::string to_hex(const std::vector<std::uint8_t> &bytes)
{
    return to_hex(bytes.data(), bytes.size());
}

// Accepts upper/lower case; nullopt on odd length or a non-hex digit.
std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex);

}  // namespace util
