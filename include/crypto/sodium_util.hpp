#pragma once
#include <cstddef>
#include <cstdint>

namespace crypto
{

// sodium_init() once per process; false if libsodium could not initialise.
bool ensure_sodium_init();

// Fills buf with len random bytes from randombytes_buf.
void random_bytes(std::uint8_t *buf, std::size_t len);

}  // namespace crypto
