#include "pqchat/identity/key_pair_authority.hpp"

#include <spdlog/spdlog.h>

namespace pqchat::identity {

KeyPairAuthority::KeyPairAuthority(std::string_view algorithm)
    : kem_(algorithm) {
    spdlog::info("Key pair authority using {}", kem_.algorithm());
}

crypto::KemKeyPair KeyPairAuthority::generate() const {
    return kem_.generate_keypair();
}

}  // namespace pqchat::identity
