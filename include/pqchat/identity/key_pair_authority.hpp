#pragma once

#include <string_view>

#include "pqchat/crypto/kem.hpp"

namespace pqchat::identity {

// Sole source of new identity key material.
// Constructing the authority is the startup capability check for the
// configured KEM; there is no fallback construction.
class KeyPairAuthority {
public:
    explicit KeyPairAuthority(std::string_view algorithm = crypto::KEM_DEFAULT);

    KeyPairAuthority(const KeyPairAuthority&) = delete;
    KeyPairAuthority& operator=(const KeyPairAuthority&) = delete;

    // Fresh, independently random keypair. Throws KeyGenError.
    crypto::KemKeyPair generate() const;

    [[nodiscard]] const crypto::Kem& kem() const { return kem_; }

private:
    crypto::Kem kem_;
};

}  // namespace pqchat::identity
