#include "pqchat/crypto/kem.hpp"

#include <oqs/oqs.h>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include <array>

#include "pqchat/errors.hpp"

namespace pqchat::crypto {

namespace {

constexpr std::array<std::string_view, 3> ALLOWED_ALGORITHMS = {
    KEM_ML_KEM_512,
    KEM_ML_KEM_768,
    KEM_ML_KEM_1024,
};

bool is_allowed(std::string_view algorithm) {
    for (auto allowed : ALLOWED_ALGORITHMS) {
        if (allowed == algorithm) {
            return true;
        }
    }
    return false;
}

}  // namespace

void Kem::KemDeleter::operator()(OQS_KEM* kem) const {
    OQS_KEM_free(kem);
}

bool Kem::is_supported(std::string_view algorithm) {
    if (!is_allowed(algorithm)) {
        return false;
    }
    std::string name(algorithm);
    return OQS_KEM_alg_is_enabled(name.c_str()) == 1;
}

Kem::Kem(std::string_view algorithm) : algorithm_(algorithm) {
    if (!is_allowed(algorithm)) {
        throw KeyGenError("KEM algorithm not permitted: " + algorithm_);
    }
    if (OQS_KEM_alg_is_enabled(algorithm_.c_str()) != 1) {
        throw KeyGenError("KEM algorithm not enabled in liboqs: " + algorithm_);
    }

    kem_.reset(OQS_KEM_new(algorithm_.c_str()));
    if (!kem_) {
        throw KeyGenError("Failed to instantiate KEM: " + algorithm_);
    }
    if (kem_->length_shared_secret != SHARED_SECRET_SIZE) {
        throw KeyGenError("Unexpected shared secret size for " + algorithm_);
    }

    spdlog::debug("KEM {} ready (pk={} sk={} ct={})", algorithm_,
                  kem_->length_public_key, kem_->length_secret_key,
                  kem_->length_ciphertext);
}

Kem::~Kem() = default;

size_t Kem::public_key_size() const {
    return kem_->length_public_key;
}

size_t Kem::secret_key_size() const {
    return kem_->length_secret_key;
}

size_t Kem::ciphertext_size() const {
    return kem_->length_ciphertext;
}

KemKeyPair Kem::generate_keypair() const {
    KemKeyPair kp;
    kp.public_key.resize(kem_->length_public_key);
    kp.secret_key = SecretBuffer(kem_->length_secret_key);

    if (OQS_KEM_keypair(kem_.get(), kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS) {
        throw KeyGenError("KEM key generation failed: " + algorithm_);
    }
    return kp;
}

Encapsulation Kem::encapsulate(std::span<const uint8_t> public_key) const {
    if (public_key.size() != kem_->length_public_key) {
        throw EncapsulationError("Public key has wrong size for " + algorithm_);
    }

    Encapsulation result;
    result.ciphertext.resize(kem_->length_ciphertext);

    if (OQS_KEM_encaps(kem_.get(), result.ciphertext.data(),
                       result.shared_secret.data(), public_key.data()) != OQS_SUCCESS) {
        sodium_memzero(result.shared_secret.data(), result.shared_secret.size());
        throw EncapsulationError("Public key rejected by " + algorithm_);
    }
    return result;
}

SharedSecret Kem::decapsulate(std::span<const uint8_t> secret_key,
                              std::span<const uint8_t> ciphertext) const {
    if (secret_key.size() != kem_->length_secret_key) {
        throw DecapsulationError("Secret key has wrong size for " + algorithm_);
    }
    if (ciphertext.size() != kem_->length_ciphertext) {
        throw DecapsulationError("KEM ciphertext has wrong size for " + algorithm_);
    }

    SharedSecret shared;
    if (OQS_KEM_decaps(kem_.get(), shared.data(), ciphertext.data(),
                       secret_key.data()) != OQS_SUCCESS) {
        sodium_memzero(shared.data(), shared.size());
        throw DecapsulationError("KEM decapsulation failed");
    }
    return shared;
}

}  // namespace pqchat::crypto
