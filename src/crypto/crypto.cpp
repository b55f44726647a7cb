#include "pqchat/crypto/crypto.hpp"

#include <oqs/oqs.h>
#include <sodium.h>

#include <mutex>

namespace pqchat::crypto {

bool init() {
    if (sodium_init() < 0) {
        return false;
    }

    static std::once_flag oqs_once;
    std::call_once(oqs_once, [] { OQS_init(); });
    return true;
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

void random_bytes(std::span<uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

SecretBuffer::SecretBuffer(size_t size) : bytes_(size) {}

SecretBuffer::SecretBuffer(std::span<const uint8_t> bytes)
    : bytes_(bytes.begin(), bytes.end()) {}

SecretBuffer::~SecretBuffer() {
    clear();
}

SecretBuffer::SecretBuffer(SecretBuffer&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretBuffer& SecretBuffer::operator=(SecretBuffer&& other) noexcept {
    if (this != &other) {
        clear();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void SecretBuffer::truncate(size_t size) {
    if (size >= bytes_.size()) {
        return;
    }
    sodium_memzero(bytes_.data() + size, bytes_.size() - size);
    bytes_.resize(size);
}

void SecretBuffer::clear() {
    if (!bytes_.empty()) {
        sodium_memzero(bytes_.data(), bytes_.size());
        bytes_.clear();
    }
}

bool SecretBuffer::operator==(const SecretBuffer& other) const {
    return constant_time_compare(bytes_, other.bytes_);
}

}  // namespace pqchat::crypto
