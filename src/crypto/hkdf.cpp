#include "pqchat/crypto/hkdf.hpp"

#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace pqchat::crypto {

namespace {
constexpr size_t HASH_LEN = 32;  // SHA-256 output length

// Helper to compute HMAC-SHA256 using libsodium's crypto_auth_hmacsha256
void hmac_sha256_impl(const uint8_t* key, size_t key_len,
                       const uint8_t* message, size_t message_len,
                       uint8_t* out) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key, key_len);
    crypto_auth_hmacsha256_update(&state, message, message_len);
    crypto_auth_hmacsha256_final(&state, out);
    sodium_memzero(&state, sizeof(state));
}
}  // namespace

HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
    HmacDigest digest;
    hmac_sha256_impl(key.data(), key.size(), message.data(), message.size(), digest.data());
    return digest;
}

HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm) {
    HmacDigest prk;

    // If salt is empty, use a string of zeros as the salt
    if (salt.empty()) {
        std::array<uint8_t, HASH_LEN> zero_salt{};
        hmac_sha256_impl(zero_salt.data(), zero_salt.size(),
                         ikm.data(), ikm.size(), prk.data());
    } else {
        hmac_sha256_impl(salt.data(), salt.size(),
                         ikm.data(), ikm.size(), prk.data());
    }

    return prk;
}

void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output) {
    if (output.size() > 255 * HASH_LEN) {
        throw std::invalid_argument("HKDF output too long");
    }

    size_t n = (output.size() + HASH_LEN - 1) / HASH_LEN;
    std::array<uint8_t, HASH_LEN> t_prev{};
    size_t t_prev_len = 0;
    size_t output_pos = 0;

    for (size_t i = 1; i <= n; ++i) {
        // T(i) = HMAC(PRK, T(i-1) || info || i)
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, prk.data(), prk.size());

        if (t_prev_len > 0) {
            crypto_auth_hmacsha256_update(&state, t_prev.data(), t_prev_len);
        }

        if (!info.empty()) {
            crypto_auth_hmacsha256_update(&state, info.data(), info.size());
        }

        uint8_t counter = static_cast<uint8_t>(i);
        crypto_auth_hmacsha256_update(&state, &counter, 1);

        crypto_auth_hmacsha256_final(&state, t_prev.data());
        sodium_memzero(&state, sizeof(state));
        t_prev_len = HASH_LEN;

        // Copy to output
        size_t to_copy = std::min<size_t>(HASH_LEN, output.size() - output_pos);
        std::memcpy(output.data() + output_pos, t_prev.data(), to_copy);
        output_pos += to_copy;
    }

    sodium_memzero(t_prev.data(), t_prev.size());
}

void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output) {
    auto prk = hkdf_extract(salt, ikm);
    hkdf_expand(prk, info, output);
    sodium_memzero(prk.data(), prk.size());
}

SymmetricKey derive_labeled_key(std::span<const uint8_t> ikm, std::string_view label) {
    if (ikm.empty()) {
        throw std::invalid_argument("HKDF input keying material is empty");
    }

    auto prk = hkdf_extract({}, ikm);

    SymmetricKey key;
    std::span<const uint8_t> info(reinterpret_cast<const uint8_t*>(label.data()), label.size());
    hkdf_expand(prk, info, key);

    secure_zero(prk.data(), prk.size());
    return key;
}

}  // namespace pqchat::crypto
