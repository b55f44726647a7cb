#include "pqchat/crypto/chacha20poly1305.hpp"

#include <sodium.h>

namespace pqchat::crypto {

Nonce random_nonce() {
    Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

bool encrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> plaintext,
                      std::span<uint8_t> ciphertext_out,
                      AuthTag& tag_out,
                      std::span<const uint8_t> additional_data) {
    if (ciphertext_out.size() != plaintext.size()) {
        return false;
    }

    unsigned long long tag_len;
    crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        ciphertext_out.data(),
        tag_out.data(), &tag_len,
        plaintext.data(), plaintext.size(),
        additional_data.data(), additional_data.size(),
        nullptr,  // nsec
        nonce.data(),
        key.data()
    );

    return tag_len == POLY1305_TAG_SIZE;
}

bool decrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> ciphertext,
                      std::span<const uint8_t> tag,
                      std::span<uint8_t> plaintext_out,
                      std::span<const uint8_t> additional_data) {
    if (tag.size() != POLY1305_TAG_SIZE || plaintext_out.size() != ciphertext.size()) {
        return false;
    }

    int rc = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        plaintext_out.data(),
        nullptr,  // nsec
        ciphertext.data(), ciphertext.size(),
        tag.data(),
        additional_data.data(), additional_data.size(),
        nonce.data(),
        key.data()
    );

    if (rc != 0) {
        sodium_memzero(plaintext_out.data(), plaintext_out.size());
        return false;
    }
    return true;
}

}  // namespace pqchat::crypto
