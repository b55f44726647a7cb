#pragma once

#include <future>
#include <span>
#include <string>
#include <vector>

#include "pqchat/config/config.hpp"
#include "pqchat/crypto/crypto.hpp"
#include "pqchat/hub/connection_hub.hpp"
#include "pqchat/identity/key_pair_authority.hpp"
#include "pqchat/identity/private_key_vault.hpp"
#include "pqchat/room/distribution_store.hpp"
#include "pqchat/room/message_cipher.hpp"
#include "pqchat/room/message_store.hpp"
#include "pqchat/room/room_key_distributor.hpp"
#include "pqchat/service/kdf_worker.hpp"
#include "pqchat/types.hpp"

namespace pqchat::service {

// Entry point the routing and persistence layers call into.
//
// Constructed explicitly at process start and passed to whoever needs it.
// Construction validates the configuration (ConfigError) and runs the KEM
// capability check (KeyGenError); a core that exists is fully capable.
class ChatCore {
public:
    ChatCore(const config::CoreConfig& config,
             room::DistributionStore& distributions,
             room::MessageStore& messages,
             hub::ConnectionHub& hub);

    ChatCore(const ChatCore&) = delete;
    ChatCore& operator=(const ChatCore&) = delete;

    // Identity lifecycle; both run on the KDF worker
    std::future<identity::Identity> register_identity(std::string password);
    std::future<crypto::SecretBuffer> unlock_identity(std::string password, Bytes wrapped_private_key);

    // Rooms
    room::RoomKeyDistributor::Distribution create_room(RoomId room,
                                                       const room::RoomKeyDistributor::Members& members);
    Bytes add_member(RoomId room, UserId user, std::span<const uint8_t> public_key,
                     room::EpochKeySource& source);
    bool leave_room(RoomId room, UserId user);
    void delete_room(RoomId room);
    Bytes distribution(RoomId room, UserId user) const;

    // Messages
    room::StoredMessage send_message(RoomId room, UserId sender,
                                     std::span<const uint8_t> shared_secret,
                                     std::span<const uint8_t> plaintext);
    Bytes open_message(std::span<const uint8_t> ciphertext,
                       std::span<const uint8_t> shared_secret) const;
    std::vector<room::StoredMessage> history(RoomId room) const;

    [[nodiscard]] const room::RoomKeyDistributor& distributor() const { return distributor_; }
    [[nodiscard]] const crypto::Kem& kem() const { return authority_.kem(); }
    [[nodiscard]] const config::CoreConfig& settings() const { return config_; }

private:
    config::CoreConfig config_;
    identity::KeyPairAuthority authority_;
    identity::PrivateKeyVault vault_;
    room::MessageCipher cipher_;
    room::RoomKeyDistributor distributor_;
    room::MessageStore& messages_;
    hub::ConnectionHub& hub_;

    // Declared last so queued derivations finish before the members they use go away
    KdfWorker kdf_worker_;
};

}  // namespace pqchat::service
