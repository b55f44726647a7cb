#include "pqchat/room/message_store.hpp"

#include <algorithm>

namespace pqchat::room {

StoredMessage InMemoryMessageStore::append(RoomId room, UserId sender, Bytes ciphertext,
                                           uint64_t sent_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    StoredMessage message;
    message.id = next_id_++;
    message.room_id = room;
    message.sender_id = sender;
    message.ciphertext = std::move(ciphertext);
    message.sent_at_ms = sent_at_ms;

    rooms_[room].push_back(message);
    return message;
}

std::vector<StoredMessage> InMemoryMessageStore::list(RoomId room) const {
    std::vector<StoredMessage> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(room);
        if (it == rooms_.end()) {
            return result;
        }
        result = it->second;
    }

    // Clock adjustments can append out of order
    std::stable_sort(result.begin(), result.end(),
                     [](const StoredMessage& a, const StoredMessage& b) {
                         if (a.sent_at_ms != b.sent_at_ms) {
                             return a.sent_at_ms < b.sent_at_ms;
                         }
                         return a.id < b.id;
                     });
    return result;
}

size_t InMemoryMessageStore::erase_room(RoomId room) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return 0;
    }
    size_t removed = it->second.size();
    rooms_.erase(it);
    return removed;
}

}  // namespace pqchat::room
