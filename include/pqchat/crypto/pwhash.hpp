#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "crypto.hpp"

namespace pqchat::crypto {

// Argon2id work factor
struct PwhashParams {
    uint64_t opslimit = 3;            // crypto_pwhash_OPSLIMIT_MODERATE
    size_t memlimit = 256ULL << 20;   // crypto_pwhash_MEMLIMIT_MODERATE (256 MiB)
};

// Floor below which a vault is considered misconfigured
// (crypto_pwhash_OPSLIMIT_INTERACTIVE / crypto_pwhash_MEMLIMIT_INTERACTIVE)
constexpr uint64_t PWHASH_MIN_OPSLIMIT = 2;
constexpr size_t PWHASH_MIN_MEMLIMIT = 64ULL << 20;

// Interactive profile, the cheapest accepted configuration
PwhashParams interactive_pwhash_params();

// True if params are at or above the floor and within libsodium's limits
bool pwhash_params_acceptable(const PwhashParams& params);

// Derive a cipher key from a password with Argon2id.
// Returns nullopt if the derivation could not run (e.g. memory exhausted).
std::optional<SymmetricKey> derive_password_key(std::string_view password,
                                                const Salt& salt,
                                                const PwhashParams& params);

}  // namespace pqchat::crypto
