#pragma once

#include <stdexcept>
#include <string>

namespace pqchat {

// Base for every error raised across a component boundary
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Message shared by AuthError and DecryptError. Callers must not be able to
// tell which check failed.
inline constexpr const char* kOpaqueFailure = "invalid credentials or corrupted data";

// KEM primitive unavailable or failed. Fatal at startup, never downgraded.
class KeyGenError : public Error {
public:
    using Error::Error;
};

// Wrong password or corrupted wrapped key
class AuthError : public Error {
public:
    AuthError() : Error(kOpaqueFailure) {}
};

// Malformed or rejected public key
class EncapsulationError : public Error {
public:
    using Error::Error;
};

// Malformed KEM ciphertext or private key
class DecapsulationError : public Error {
public:
    using Error::Error;
};

// AEAD authentication failure on any sealed blob
class DecryptError : public Error {
public:
    DecryptError() : Error(kOpaqueFailure) {}
};

// No distribution record for a member
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Delivery attempted on a dead connection
class ConnectionClosed : public Error {
public:
    using Error::Error;
};

// Membership conflict (duplicate distribution, sponsor not a member)
class MembershipError : public Error {
public:
    using Error::Error;
};

// Invalid configuration detected at startup
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace pqchat
