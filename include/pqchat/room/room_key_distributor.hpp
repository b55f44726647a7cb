#pragma once

#include <map>
#include <span>

#include "pqchat/crypto/crypto.hpp"
#include "pqchat/crypto/kem.hpp"
#include "pqchat/room/distribution_store.hpp"
#include "pqchat/room/message_cipher.hpp"
#include "pqchat/types.hpp"

namespace pqchat::room {

// Yields a room's current epoch key for the duration of one call
class EpochKeySource {
public:
    virtual ~EpochKeySource() = default;

    virtual crypto::SecretBuffer acquire(RoomId room) = 0;
};

// Generates room epoch keys and hands one encapsulated copy to each member.
//
// Entry layout: kem_ciphertext(fixed by KEM) || nonce(12) || tag(16) || sealed_epoch_key(32)
//
// The epoch key only exists inside a single call; it is never returned to
// callers of create_room_key and never stored in cleartext.
class RoomKeyDistributor {
public:
    using Members = std::map<UserId, Bytes>;
    using Distribution = std::map<UserId, Bytes>;

    RoomKeyDistributor(const crypto::Kem& kem, const MessageCipher& cipher, DistributionStore& store);

    // One entry per member, also recorded in the store. An empty member set
    // is valid and yields an empty distribution.
    // Throws EncapsulationError (nothing recorded) or MembershipError if the
    // room already has distributions.
    Distribution create_room_key(RoomId room, const Members& members);

    // New entry for a joining member; existing entries are untouched.
    // Throws MembershipError if the member already has an entry.
    Bytes add_member(RoomId room, UserId user, std::span<const uint8_t> public_key,
                     EpochKeySource& source);

    // Throws NotFoundError
    Bytes get_distribution(RoomId room, UserId user) const;

    bool remove_member(RoomId room, UserId user);
    size_t remove_room(RoomId room);

    // Member side: decapsulate and open an entry to recover the epoch key.
    // Throws DecapsulationError on a malformed entry, DecryptError if the
    // sealed key does not authenticate (e.g. the wrong private key).
    crypto::SecretBuffer open_distribution(std::span<const uint8_t> private_key,
                                           std::span<const uint8_t> entry) const;

    [[nodiscard]] size_t entry_size() const;

private:
    Bytes seal_for_member(std::span<const uint8_t> public_key,
                          const crypto::SecretBuffer& epoch_key) const;

    const crypto::Kem& kem_;
    const MessageCipher& cipher_;
    DistributionStore& store_;
};

// Sender-mediated key source: a current member opens their own entry with
// their unlocked private key so the epoch key can be re-encapsulated for a
// joiner. The private key is borrowed, not copied.
class SponsorKeySource : public EpochKeySource {
public:
    SponsorKeySource(const RoomKeyDistributor& distributor,
                     UserId sponsor,
                     const crypto::SecretBuffer& sponsor_private_key);

    // Throws MembershipError if the sponsor holds no entry for the room
    crypto::SecretBuffer acquire(RoomId room) override;

private:
    const RoomKeyDistributor& distributor_;
    UserId sponsor_;
    const crypto::SecretBuffer& private_key_;
};

}  // namespace pqchat::room
