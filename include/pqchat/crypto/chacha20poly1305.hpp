#pragma once

#include <span>
#include "crypto.hpp"

namespace pqchat::crypto {

// Fresh random 96-bit nonce
Nonce random_nonce();

// ChaCha20-Poly1305 (IETF) encryption with a detached tag.
// ciphertext_out must be exactly plaintext.size() bytes; it may alias plaintext.
bool encrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> plaintext,
                      std::span<uint8_t> ciphertext_out,
                      AuthTag& tag_out,
                      std::span<const uint8_t> additional_data = {});

// ChaCha20-Poly1305 (IETF) decryption with a detached tag.
// Returns false on authentication failure; plaintext_out is wiped in that case.
bool decrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> ciphertext,
                      std::span<const uint8_t> tag,
                      std::span<uint8_t> plaintext_out,
                      std::span<const uint8_t> additional_data = {});

}  // namespace pqchat::crypto
