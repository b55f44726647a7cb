#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto.hpp"

struct OQS_KEM;

namespace pqchat::crypto {

// Lattice KEM parameter sets accepted by the service
constexpr std::string_view KEM_ML_KEM_512 = "ML-KEM-512";
constexpr std::string_view KEM_ML_KEM_768 = "ML-KEM-768";
constexpr std::string_view KEM_ML_KEM_1024 = "ML-KEM-1024";
constexpr std::string_view KEM_DEFAULT = KEM_ML_KEM_768;

// KEM key pair
struct KemKeyPair {
    std::vector<uint8_t> public_key;
    SecretBuffer secret_key;
};

// Result of encapsulating against a public key
struct Encapsulation {
    SharedSecret shared_secret;
    std::vector<uint8_t> ciphertext;
};

// liboqs-backed key encapsulation mechanism.
// Construction is the capability check: it throws KeyGenError if the
// algorithm is not on the allow-list or not available in the linked liboqs.
// All operations are const and reentrant.
class Kem {
public:
    explicit Kem(std::string_view algorithm = KEM_DEFAULT);
    ~Kem();

    Kem(const Kem&) = delete;
    Kem& operator=(const Kem&) = delete;

    // True if the algorithm is allowed and enabled in liboqs
    static bool is_supported(std::string_view algorithm);

    [[nodiscard]] const std::string& algorithm() const { return algorithm_; }
    [[nodiscard]] size_t public_key_size() const;
    [[nodiscard]] size_t secret_key_size() const;
    [[nodiscard]] size_t ciphertext_size() const;

    // Throws KeyGenError
    KemKeyPair generate_keypair() const;

    // Throws EncapsulationError on a malformed public key
    Encapsulation encapsulate(std::span<const uint8_t> public_key) const;

    // Throws DecapsulationError on a malformed secret key or ciphertext
    SharedSecret decapsulate(std::span<const uint8_t> secret_key,
                             std::span<const uint8_t> ciphertext) const;

private:
    struct KemDeleter {
        void operator()(OQS_KEM* kem) const;
    };

    std::string algorithm_;
    std::unique_ptr<OQS_KEM, KemDeleter> kem_;
};

}  // namespace pqchat::crypto
