#pragma once

#include <span>
#include <string_view>

#include "pqchat/crypto/crypto.hpp"
#include "pqchat/types.hpp"

namespace pqchat::room {

// Authenticated encryption of payloads under a KEM shared secret.
//
// Sealed layout: nonce(12) || tag(16) || ciphertext(var)
//
// The cipher key is never the shared secret itself: it is derived with
// HKDF-SHA256 under a label fixed per purpose, so a secret that carries an
// epoch key cannot be turned into a message key or the other way round.
// Every seal draws a fresh random nonce.
class MessageCipher {
public:
    enum class Purpose {
        MESSAGE,
        EPOCH_KEY_WRAP
    };

    static constexpr size_t NONCE_OFFSET = 0;
    static constexpr size_t TAG_OFFSET = NONCE_OFFSET + crypto::CHACHA20_NONCE_SIZE;
    static constexpr size_t CIPHERTEXT_OFFSET = TAG_OFFSET + crypto::POLY1305_TAG_SIZE;
    static constexpr size_t OVERHEAD = CIPHERTEXT_OFFSET;

    static std::string_view label(Purpose purpose);

    // Chat payloads
    Bytes encrypt(std::span<const uint8_t> plaintext, std::span<const uint8_t> secret) const;

    // Throws DecryptError on tamper, wrong key or truncated input
    Bytes decrypt(std::span<const uint8_t> blob, std::span<const uint8_t> secret) const;

    // Sealing and opening steps shared with key distribution
    Bytes seal(std::span<const uint8_t> plaintext,
               std::span<const uint8_t> secret,
               Purpose purpose) const;

    // Throws DecryptError; no partial plaintext is ever returned
    crypto::SecretBuffer open(std::span<const uint8_t> blob,
                              std::span<const uint8_t> secret,
                              Purpose purpose) const;
};

}  // namespace pqchat::room
