#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pqchat::crypto {

// Key sizes
constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;
constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t HMAC_SHA256_SIZE = 32;
constexpr size_t PWHASH_SALT_SIZE = 16;
constexpr size_t SHARED_SECRET_SIZE = 32;
constexpr size_t EPOCH_KEY_SIZE = 32;

using SymmetricKey = std::array<uint8_t, CHACHA20_KEY_SIZE>;
using Nonce = std::array<uint8_t, CHACHA20_NONCE_SIZE>;
using AuthTag = std::array<uint8_t, POLY1305_TAG_SIZE>;
using HmacDigest = std::array<uint8_t, HMAC_SHA256_SIZE>;
using Salt = std::array<uint8_t, PWHASH_SALT_SIZE>;
using SharedSecret = std::array<uint8_t, SHARED_SECRET_SIZE>;
using EpochKey = std::array<uint8_t, EPOCH_KEY_SIZE>;

// Initialize the crypto subsystem (libsodium and liboqs)
bool init();

// Securely zero memory
void secure_zero(void* ptr, size_t len);

// Generate random bytes
void random_bytes(std::span<uint8_t> output);

// Constant-time comparison
bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Owning byte buffer for secret material.
// Contents are wiped on destruction and before being overwritten.
class SecretBuffer {
public:
    SecretBuffer() = default;
    explicit SecretBuffer(size_t size);
    explicit SecretBuffer(std::span<const uint8_t> bytes);
    ~SecretBuffer();

    SecretBuffer(const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;

    SecretBuffer(SecretBuffer&& other) noexcept;
    SecretBuffer& operator=(SecretBuffer&& other) noexcept;

    [[nodiscard]] uint8_t* data() { return bytes_.data(); }
    [[nodiscard]] const uint8_t* data() const { return bytes_.data(); }
    [[nodiscard]] size_t size() const { return bytes_.size(); }
    [[nodiscard]] bool empty() const { return bytes_.empty(); }

    [[nodiscard]] std::span<uint8_t> span() { return bytes_; }
    [[nodiscard]] std::span<const uint8_t> span() const { return bytes_; }

    // Shrink to `size` bytes, wiping the dropped tail
    void truncate(size_t size);

    void clear();

    bool operator==(const SecretBuffer& other) const;

private:
    std::vector<uint8_t> bytes_;
};

}  // namespace pqchat::crypto
