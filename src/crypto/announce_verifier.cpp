#include <sodium.h>

#include "crypto/announce_verifier.hpp"
#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(SIGNING_KEY_SIZE == crypto_sign_PUBLICKEYBYTES, "signing key size mismatch");
static_assert(SIGNATURE_SIZE == crypto_sign_BYTES, "signature size mismatch");

bool SodiumAnnounceVerifier::verify(const std::vector<std::uint8_t> &signed_data,
                                    const std::vector<std::uint8_t> &signature,
                                    const std::vector<std::uint8_t> &signing_public_key)
{
    if (!ensure_sodium_init())
        return false;

    if (signing_public_key.size() != SIGNING_KEY_SIZE || signature.size() != SIGNATURE_SIZE)
    {
        LOG_DEBUG("verify: bad sizes (key=%zu, sig=%zu)", signing_public_key.size(),
                  signature.size());
        return false;
    }

    return crypto_sign_verify_detached(signature.data(), signed_data.data(), signed_data.size(),
                                       signing_public_key.data()) == 0;
}

}  // namespace crypto
