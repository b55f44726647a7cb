#include "pqchat/crypto/pwhash.hpp"

#include <sodium.h>

static_assert(pqchat::crypto::PWHASH_SALT_SIZE == crypto_pwhash_SALTBYTES,
              "salt size must match libsodium's Argon2id salt");

namespace pqchat::crypto {

PwhashParams interactive_pwhash_params() {
    PwhashParams params;
    params.opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    params.memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
    return params;
}

bool pwhash_params_acceptable(const PwhashParams& params) {
    if (params.opslimit < PWHASH_MIN_OPSLIMIT || params.memlimit < PWHASH_MIN_MEMLIMIT) {
        return false;
    }
    return params.opslimit <= crypto_pwhash_OPSLIMIT_MAX &&
           params.memlimit <= crypto_pwhash_MEMLIMIT_MAX;
}

std::optional<SymmetricKey> derive_password_key(std::string_view password,
                                                const Salt& salt,
                                                const PwhashParams& params) {
    SymmetricKey key;
    if (crypto_pwhash(key.data(), key.size(),
                      password.data(), password.size(),
                      salt.data(),
                      params.opslimit, params.memlimit,
                      crypto_pwhash_ALG_ARGON2ID13) != 0) {
        sodium_memzero(key.data(), key.size());
        return std::nullopt;
    }
    return key;
}

}  // namespace pqchat::crypto
