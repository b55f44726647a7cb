#include "pqchat/room/room_key_distributor.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "pqchat/errors.hpp"

namespace pqchat::room {

RoomKeyDistributor::RoomKeyDistributor(const crypto::Kem& kem,
                                       const MessageCipher& cipher,
                                       DistributionStore& store)
    : kem_(kem), cipher_(cipher), store_(store) {}

size_t RoomKeyDistributor::entry_size() const {
    return kem_.ciphertext_size() + MessageCipher::OVERHEAD + crypto::EPOCH_KEY_SIZE;
}

Bytes RoomKeyDistributor::seal_for_member(std::span<const uint8_t> public_key,
                                          const crypto::SecretBuffer& epoch_key) const {
    auto encapsulation = kem_.encapsulate(public_key);

    Bytes sealed;
    try {
        sealed = cipher_.seal(epoch_key.span(), encapsulation.shared_secret,
                              MessageCipher::Purpose::EPOCH_KEY_WRAP);
    } catch (...) {
        crypto::secure_zero(encapsulation.shared_secret.data(), encapsulation.shared_secret.size());
        throw;
    }
    crypto::secure_zero(encapsulation.shared_secret.data(), encapsulation.shared_secret.size());

    Bytes entry = std::move(encapsulation.ciphertext);
    entry.insert(entry.end(), sealed.begin(), sealed.end());
    return entry;
}

RoomKeyDistributor::Distribution RoomKeyDistributor::create_room_key(RoomId room,
                                                                     const Members& members) {
    if (!store_.members(room).empty()) {
        throw MembershipError("Room " + std::to_string(room) + " already has key distributions");
    }

    crypto::SecretBuffer epoch_key(crypto::EPOCH_KEY_SIZE);
    crypto::random_bytes(epoch_key.span());

    // Build every entry before recording any, so a bad public key leaves
    // the store untouched
    Distribution distribution;
    for (const auto& [user, public_key] : members) {
        distribution.emplace(user, seal_for_member(public_key, epoch_key));
    }
    epoch_key.clear();

    std::vector<KeyDistribution> records;
    records.reserve(distribution.size());
    for (const auto& [user, entry] : distribution) {
        KeyDistribution record;
        record.room_id = room;
        record.user_id = user;
        record.epoch = INITIAL_EPOCH;
        record.encapsulated_blob = entry;
        records.push_back(std::move(record));
    }

    // Checked again atomically; a concurrent create may have won since
    if (!store_.insert_room(room, std::move(records))) {
        throw MembershipError("Room " + std::to_string(room) + " already has key distributions");
    }

    if (distribution.empty()) {
        spdlog::info("Room {} keyed with no members", room);
    } else {
        spdlog::info("Room {} keyed for {} members", room, distribution.size());
    }
    return distribution;
}

Bytes RoomKeyDistributor::add_member(RoomId room, UserId user,
                                     std::span<const uint8_t> public_key,
                                     EpochKeySource& source) {
    if (store_.find(room, user)) {
        throw MembershipError("User " + std::to_string(user) + " already holds a key for room " +
                              std::to_string(room));
    }

    auto epoch_key = source.acquire(room);
    if (epoch_key.size() != crypto::EPOCH_KEY_SIZE) {
        throw DecryptError();
    }

    Bytes entry = seal_for_member(public_key, epoch_key);
    epoch_key.clear();

    KeyDistribution record;
    record.room_id = room;
    record.user_id = user;
    record.epoch = INITIAL_EPOCH;
    record.encapsulated_blob = entry;
    if (!store_.insert(std::move(record))) {
        throw MembershipError("User " + std::to_string(user) + " already holds a key for room " +
                              std::to_string(room));
    }

    spdlog::info("User {} added to room {}", user, room);
    return entry;
}

Bytes RoomKeyDistributor::get_distribution(RoomId room, UserId user) const {
    auto record = store_.find(room, user);
    if (!record) {
        throw NotFoundError("No key distribution for user " + std::to_string(user) +
                            " in room " + std::to_string(room));
    }
    return std::move(record->encapsulated_blob);
}

bool RoomKeyDistributor::remove_member(RoomId room, UserId user) {
    bool removed = store_.erase_member(room, user);
    if (removed) {
        spdlog::info("User {} removed from room {}", user, room);
    }
    return removed;
}

size_t RoomKeyDistributor::remove_room(RoomId room) {
    size_t removed = store_.erase_room(room);
    spdlog::info("Room {} dropped {} key distributions", room, removed);
    return removed;
}

crypto::SecretBuffer RoomKeyDistributor::open_distribution(std::span<const uint8_t> private_key,
                                                           std::span<const uint8_t> entry) const {
    const size_t kem_ct_size = kem_.ciphertext_size();
    if (entry.size() < kem_ct_size) {
        throw DecapsulationError("Key distribution entry is truncated");
    }

    auto sealed = entry.subspan(kem_ct_size);
    if (sealed.size() != MessageCipher::OVERHEAD + crypto::EPOCH_KEY_SIZE) {
        throw DecryptError();
    }

    auto shared = kem_.decapsulate(private_key, entry.first(kem_ct_size));

    crypto::SecretBuffer epoch_key;
    try {
        epoch_key = cipher_.open(sealed, shared, MessageCipher::Purpose::EPOCH_KEY_WRAP);
    } catch (...) {
        crypto::secure_zero(shared.data(), shared.size());
        throw;
    }
    crypto::secure_zero(shared.data(), shared.size());

    return epoch_key;
}

SponsorKeySource::SponsorKeySource(const RoomKeyDistributor& distributor,
                                   UserId sponsor,
                                   const crypto::SecretBuffer& sponsor_private_key)
    : distributor_(distributor), sponsor_(sponsor), private_key_(sponsor_private_key) {}

crypto::SecretBuffer SponsorKeySource::acquire(RoomId room) {
    Bytes entry;
    try {
        entry = distributor_.get_distribution(room, sponsor_);
    } catch (const NotFoundError&) {
        throw MembershipError("Sponsor " + std::to_string(sponsor_) + " is not a member of room " +
                              std::to_string(room));
    }
    return distributor_.open_distribution(private_key_.span(), entry);
}

}  // namespace pqchat::room
