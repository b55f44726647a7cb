#include "pqchat/room/message_cipher.hpp"

#include <algorithm>

#include "pqchat/crypto/chacha20poly1305.hpp"
#include "pqchat/crypto/hkdf.hpp"
#include "pqchat/errors.hpp"

namespace pqchat::room {

namespace {

constexpr std::string_view MESSAGE_LABEL = "pqchat_v1_message_key";
constexpr std::string_view EPOCH_KEY_WRAP_LABEL = "pqchat_v1_epoch_key_wrap";

}  // namespace

std::string_view MessageCipher::label(Purpose purpose) {
    switch (purpose) {
        case Purpose::MESSAGE: return MESSAGE_LABEL;
        case Purpose::EPOCH_KEY_WRAP: return EPOCH_KEY_WRAP_LABEL;
    }
    return MESSAGE_LABEL;
}

Bytes MessageCipher::encrypt(std::span<const uint8_t> plaintext,
                             std::span<const uint8_t> secret) const {
    return seal(plaintext, secret, Purpose::MESSAGE);
}

Bytes MessageCipher::decrypt(std::span<const uint8_t> blob,
                             std::span<const uint8_t> secret) const {
    auto plaintext = open(blob, secret, Purpose::MESSAGE);
    return Bytes(plaintext.data(), plaintext.data() + plaintext.size());
}

Bytes MessageCipher::seal(std::span<const uint8_t> plaintext,
                          std::span<const uint8_t> secret,
                          Purpose purpose) const {
    auto key = crypto::derive_labeled_key(secret, label(purpose));
    auto nonce = crypto::random_nonce();

    Bytes blob(OVERHEAD + plaintext.size());
    std::copy(nonce.begin(), nonce.end(), blob.begin() + NONCE_OFFSET);

    crypto::AuthTag tag;
    std::span<uint8_t> ciphertext(blob.data() + CIPHERTEXT_OFFSET, plaintext.size());
    bool sealed = crypto::encrypt_detached(key, nonce, plaintext, ciphertext, tag);
    crypto::secure_zero(key.data(), key.size());

    if (!sealed) {
        throw Error("Payload sealing failed");
    }
    std::copy(tag.begin(), tag.end(), blob.begin() + TAG_OFFSET);

    return blob;
}

crypto::SecretBuffer MessageCipher::open(std::span<const uint8_t> blob,
                                         std::span<const uint8_t> secret,
                                         Purpose purpose) const {
    if (blob.size() < OVERHEAD || secret.empty()) {
        throw DecryptError();
    }

    crypto::Nonce nonce;
    std::copy_n(blob.begin() + NONCE_OFFSET, nonce.size(), nonce.begin());
    auto tag = blob.subspan(TAG_OFFSET, crypto::POLY1305_TAG_SIZE);
    auto ciphertext = blob.subspan(CIPHERTEXT_OFFSET);

    auto key = crypto::derive_labeled_key(secret, label(purpose));

    crypto::SecretBuffer plaintext(ciphertext.size());
    bool opened = crypto::decrypt_detached(key, nonce, ciphertext, tag, plaintext.span());
    crypto::secure_zero(key.data(), key.size());

    if (!opened) {
        throw DecryptError();
    }
    return plaintext;
}

}  // namespace pqchat::room
