#include <sodium.h>

#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace crypto
{

bool ensure_sodium_init()
{
    static const bool ok = [] {
        if (sodium_init() < 0)  // -1 means failed, 1 means already initialised
        {
            LOG_ERROR("sodium_init failed");
            return false;
        }
        return true;
    }();
    return ok;
}

void random_bytes(std::uint8_t *buf, std::size_t len)
{
    ensure_sodium_init();
    randombytes_buf(buf, len);
}

}  // namespace crypto
