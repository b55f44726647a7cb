#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "pqchat/types.hpp"

namespace pqchat::room {

// Stored chat message; immutable once appended
struct StoredMessage {
    MessageId id{0};
    RoomId room_id{0};
    UserId sender_id{0};
    Bytes ciphertext;
    uint64_t sent_at_ms{0};
};

// Persistence seam for message ciphertexts
class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Assigns the next message id
    virtual StoredMessage append(RoomId room, UserId sender, Bytes ciphertext,
                                 uint64_t sent_at_ms) = 0;

    // Messages of a room ordered by sent_at, then id
    virtual std::vector<StoredMessage> list(RoomId room) const = 0;

    virtual size_t erase_room(RoomId room) = 0;
};

// Thread-safe in-memory store
class InMemoryMessageStore : public MessageStore {
public:
    StoredMessage append(RoomId room, UserId sender, Bytes ciphertext,
                         uint64_t sent_at_ms) override;
    std::vector<StoredMessage> list(RoomId room) const override;
    size_t erase_room(RoomId room) override;

private:
    mutable std::mutex mutex_;
    MessageId next_id_{1};
    std::map<RoomId, std::vector<StoredMessage>> rooms_;
};

}  // namespace pqchat::room
