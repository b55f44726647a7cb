#pragma once

#include <span>
#include <string_view>
#include "crypto.hpp"

namespace pqchat::crypto {

// HMAC-SHA256
HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

// HKDF-SHA256 Extract
// Returns PRK (pseudorandom key)
HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm);

// HKDF-SHA256 Expand
// Derives output key material from PRK
void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output);

// Combined HKDF Extract and Expand
void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output);

// Derive a cipher key bound to a context label.
// The same input keying material under two different labels yields
// unrelated keys.
SymmetricKey derive_labeled_key(std::span<const uint8_t> ikm, std::string_view label);

}  // namespace pqchat::crypto
