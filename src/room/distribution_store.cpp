#include "pqchat/room/distribution_store.hpp"

#include <stdexcept>
#include <string>

namespace pqchat::room {

bool InMemoryDistributionStore::insert(KeyDistribution record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{record.room_id, record.user_id};
    auto it = records_.find(key);
    if (it != records_.end() && it->second.epoch == record.epoch) {
        return false;
    }
    records_[key] = std::move(record);
    return true;
}

bool InMemoryDistributionStore::insert_room(RoomId room, std::vector<KeyDistribution> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (has_room(room)) {
        return false;
    }
    for (const auto& record : records) {
        if (record.room_id != room) {
            throw std::invalid_argument("Record for room " + std::to_string(record.room_id) +
                                        " in batch for room " + std::to_string(room));
        }
    }
    for (auto& record : records) {
        Key key{record.room_id, record.user_id};
        records_[key] = std::move(record);
    }
    return true;
}

bool InMemoryDistributionStore::has_room(RoomId room) const {
    auto it = records_.lower_bound(Key{room, 0});
    return it != records_.end() && it->first.first == room;
}

std::optional<KeyDistribution> InMemoryDistributionStore::find(RoomId room, UserId user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(Key{room, user});
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryDistributionStore::erase_member(RoomId room, UserId user) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(Key{room, user}) > 0;
}

size_t InMemoryDistributionStore::erase_room(RoomId room) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto first = records_.lower_bound(Key{room, 0});
    auto last = first;
    size_t removed = 0;
    while (last != records_.end() && last->first.first == room) {
        ++last;
        ++removed;
    }
    records_.erase(first, last);
    return removed;
}

std::vector<UserId> InMemoryDistributionStore::members(RoomId room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UserId> result;
    for (auto it = records_.lower_bound(Key{room, 0});
         it != records_.end() && it->first.first == room; ++it) {
        result.push_back(it->first.second);
    }
    return result;
}

size_t InMemoryDistributionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace pqchat::room
