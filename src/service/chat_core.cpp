#include "pqchat/service/chat_core.hpp"

#include <spdlog/spdlog.h>

#include "pqchat/errors.hpp"
#include "pqchat/hub/chat_event.hpp"
#include "pqchat/utils/time.hpp"

namespace pqchat::service {

namespace {

const config::CoreConfig& checked(const config::CoreConfig& config) {
    auto validation = config::validate_config(config);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            spdlog::critical("Config: {}", error);
        }
        throw ConfigError(validation.errors.front());
    }
    return config;
}

void wipe(std::string& secret) {
    crypto::secure_zero(secret.data(), secret.size());
    secret.clear();
}

}  // namespace

ChatCore::ChatCore(const config::CoreConfig& config,
                   room::DistributionStore& distributions,
                   room::MessageStore& messages,
                   hub::ConnectionHub& hub)
    : config_(checked(config)),
      authority_(config_.kem_algorithm),
      vault_(config_.pwhash),
      distributor_(authority_.kem(), cipher_, distributions),
      messages_(messages),
      hub_(hub),
      kdf_worker_(config_.kdf_workers) {
    spdlog::info("Chat core ready: kem={} argon2id ops={} mem={} MiB workers={}",
                 config_.kem_algorithm, config_.pwhash.opslimit,
                 config_.pwhash.memlimit >> 20, config_.kdf_workers);
}

std::future<identity::Identity> ChatCore::register_identity(std::string password) {
    return kdf_worker_.submit([this, password = std::move(password)]() mutable {
        auto keypair = authority_.generate();

        identity::Identity id;
        try {
            id.wrapped_private_key = vault_.wrap(keypair.secret_key.span(), password);
        } catch (...) {
            wipe(password);
            throw;
        }
        wipe(password);

        id.public_key = std::move(keypair.public_key);
        spdlog::debug("Identity registered ({} byte public key)", id.public_key.size());
        return id;
    });
}

std::future<crypto::SecretBuffer> ChatCore::unlock_identity(std::string password,
                                                            Bytes wrapped_private_key) {
    return kdf_worker_.submit([this, password = std::move(password),
                               wrapped = std::move(wrapped_private_key)]() mutable {
        crypto::SecretBuffer private_key;
        try {
            private_key = vault_.unwrap(wrapped, password);
        } catch (...) {
            wipe(password);
            throw;
        }
        wipe(password);

        if (private_key.size() != authority_.kem().secret_key_size()) {
            // Authenticated but not a key for this KEM; report like any other mismatch
            throw AuthError();
        }
        return private_key;
    });
}

room::RoomKeyDistributor::Distribution ChatCore::create_room(
    RoomId room, const room::RoomKeyDistributor::Members& members) {
    return distributor_.create_room_key(room, members);
}

Bytes ChatCore::add_member(RoomId room, UserId user, std::span<const uint8_t> public_key,
                           room::EpochKeySource& source) {
    return distributor_.add_member(room, user, public_key, source);
}

bool ChatCore::leave_room(RoomId room, UserId user) {
    return distributor_.remove_member(room, user);
}

void ChatCore::delete_room(RoomId room) {
    distributor_.remove_room(room);
    size_t dropped = messages_.erase_room(room);
    spdlog::info("Room {} deleted with {} messages", room, dropped);
}

Bytes ChatCore::distribution(RoomId room, UserId user) const {
    return distributor_.get_distribution(room, user);
}

room::StoredMessage ChatCore::send_message(RoomId room, UserId sender,
                                           std::span<const uint8_t> shared_secret,
                                           std::span<const uint8_t> plaintext) {
    auto ciphertext = cipher_.encrypt(plaintext, shared_secret);
    auto stored = messages_.append(room, sender, std::move(ciphertext), utils::unix_time_ms());

    hub::ChatEvent event;
    event.room_id = stored.room_id;
    event.sender_id = stored.sender_id;
    event.message_id = stored.id;
    event.sent_at_ms = stored.sent_at_ms;
    event.ciphertext = stored.ciphertext;

    auto result = hub_.broadcast(hub::encode_event(event), room);
    spdlog::debug("Message {} in room {} pushed to {} connections",
                  stored.id, room, result.delivered);
    return stored;
}

Bytes ChatCore::open_message(std::span<const uint8_t> ciphertext,
                             std::span<const uint8_t> shared_secret) const {
    return cipher_.decrypt(ciphertext, shared_secret);
}

std::vector<room::StoredMessage> ChatCore::history(RoomId room) const {
    return messages_.list(room);
}

}  // namespace pqchat::service
