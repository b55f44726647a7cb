#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "pqchat/types.hpp"

namespace pqchat::room {

// One member's copy of a room's epoch key
struct KeyDistribution {
    RoomId room_id{0};
    UserId user_id{0};
    KeyEpoch epoch{INITIAL_EPOCH};
    Bytes encapsulated_blob;
};

// Persistence seam for key distribution records.
// Implementations must be safe to call from multiple threads.
class DistributionStore {
public:
    virtual ~DistributionStore() = default;

    // Returns false if (room, user, epoch) already has a record
    virtual bool insert(KeyDistribution record) = 0;

    // Records a new room's entries all or nothing. Returns false, storing
    // none of them, if the room already has any record.
    virtual bool insert_room(RoomId room, std::vector<KeyDistribution> records) = 0;

    // Current-epoch record for a member
    virtual std::optional<KeyDistribution> find(RoomId room, UserId user) const = 0;

    virtual bool erase_member(RoomId room, UserId user) = 0;

    // Returns the number of records removed
    virtual size_t erase_room(RoomId room) = 0;

    virtual std::vector<UserId> members(RoomId room) const = 0;
};

// Thread-safe in-memory store
class InMemoryDistributionStore : public DistributionStore {
public:
    bool insert(KeyDistribution record) override;
    bool insert_room(RoomId room, std::vector<KeyDistribution> records) override;
    std::optional<KeyDistribution> find(RoomId room, UserId user) const override;
    bool erase_member(RoomId room, UserId user) override;
    size_t erase_room(RoomId room) override;
    std::vector<UserId> members(RoomId room) const override;

    [[nodiscard]] size_t size() const;

private:
    bool has_room(RoomId room) const;

    using Key = std::pair<RoomId, UserId>;

    mutable std::mutex mutex_;
    // Keyed by (room, user); epoch is the room's only epoch
    std::map<Key, KeyDistribution> records_;
};

}  // namespace pqchat::room
