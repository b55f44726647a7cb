#include "pqchat/identity/private_key_vault.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

#include "pqchat/crypto/chacha20poly1305.hpp"
#include "pqchat/errors.hpp"
#include "pqchat/utils/time.hpp"

namespace pqchat::identity {

PrivateKeyVault::PrivateKeyVault(const crypto::PwhashParams& params)
    : params_(params) {}

Bytes PrivateKeyVault::wrap(std::span<const uint8_t> private_key,
                            std::string_view password) const {
    if (private_key.empty()) {
        throw std::invalid_argument("Private key is empty");
    }

    crypto::Salt salt;
    crypto::random_bytes(salt);

    utils::Timer timer;
    auto key = crypto::derive_password_key(password, salt, params_);
    if (!key) {
        throw Error("Password key derivation failed");
    }
    spdlog::debug("Vault key derived in {} ms", timer.elapsed_ms());

    auto nonce = crypto::random_nonce();

    Bytes blob(HEADER_SIZE + private_key.size());
    std::copy(salt.begin(), salt.end(), blob.begin() + SALT_OFFSET);
    std::copy(nonce.begin(), nonce.end(), blob.begin() + NONCE_OFFSET);

    crypto::AuthTag tag;
    std::span<uint8_t> ciphertext(blob.data() + CIPHERTEXT_OFFSET, private_key.size());
    bool sealed = crypto::encrypt_detached(*key, nonce, private_key, ciphertext, tag);
    crypto::secure_zero(key->data(), key->size());

    if (!sealed) {
        throw Error("Private key sealing failed");
    }
    std::copy(tag.begin(), tag.end(), blob.begin() + TAG_OFFSET);

    return blob;
}

crypto::SecretBuffer PrivateKeyVault::unwrap(std::span<const uint8_t> blob,
                                             std::string_view password) const {
    if (blob.size() <= HEADER_SIZE) {
        throw AuthError();
    }

    crypto::Salt salt;
    std::copy_n(blob.begin() + SALT_OFFSET, salt.size(), salt.begin());
    crypto::Nonce nonce;
    std::copy_n(blob.begin() + NONCE_OFFSET, nonce.size(), nonce.begin());

    auto tag = blob.subspan(TAG_OFFSET, crypto::POLY1305_TAG_SIZE);
    auto ciphertext = blob.subspan(CIPHERTEXT_OFFSET);

    utils::Timer timer;
    auto key = crypto::derive_password_key(password, salt, params_);
    if (!key) {
        throw Error("Password key derivation failed");
    }
    spdlog::debug("Vault key derived in {} ms", timer.elapsed_ms());

    crypto::SecretBuffer private_key(ciphertext.size());
    bool opened = crypto::decrypt_detached(*key, nonce, ciphertext, tag, private_key.span());
    crypto::secure_zero(key->data(), key->size());

    if (!opened) {
        throw AuthError();
    }
    return private_key;
}

}  // namespace pqchat::identity
