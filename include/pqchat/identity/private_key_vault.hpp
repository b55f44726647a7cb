#pragma once

#include <span>
#include <string_view>

#include "pqchat/crypto/crypto.hpp"
#include "pqchat/crypto/pwhash.hpp"
#include "pqchat/types.hpp"

namespace pqchat::identity {

// A user's stored cryptographic material. The private half is only ever
// held in wrapped form.
struct Identity {
    Bytes public_key;
    Bytes wrapped_private_key;
};

// Password-based wrapping of KEM private keys.
//
// Wrapped layout: salt(16) || nonce(12) || tag(16) || ciphertext(var)
//
// The wrapping key is derived with Argon2id from the password and a fresh
// salt, and the private key is sealed with ChaCha20-Poly1305 under a fresh
// nonce. Stateless apart from the work factor; safe to call concurrently.
class PrivateKeyVault {
public:
    static constexpr size_t SALT_OFFSET = 0;
    static constexpr size_t NONCE_OFFSET = SALT_OFFSET + crypto::PWHASH_SALT_SIZE;
    static constexpr size_t TAG_OFFSET = NONCE_OFFSET + crypto::CHACHA20_NONCE_SIZE;
    static constexpr size_t CIPHERTEXT_OFFSET = TAG_OFFSET + crypto::POLY1305_TAG_SIZE;
    static constexpr size_t HEADER_SIZE = CIPHERTEXT_OFFSET;

    explicit PrivateKeyVault(const crypto::PwhashParams& params = {});

    // Throws std::invalid_argument on an empty key
    Bytes wrap(std::span<const uint8_t> private_key, std::string_view password) const;

    // Throws AuthError on a wrong password or a corrupted blob, without
    // saying which
    crypto::SecretBuffer unwrap(std::span<const uint8_t> blob, std::string_view password) const;

    [[nodiscard]] const crypto::PwhashParams& params() const { return params_; }

private:
    crypto::PwhashParams params_;
};

}  // namespace pqchat::identity
