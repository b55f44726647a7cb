#include "pqchat/hub/connection_hub.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

#include "pqchat/errors.hpp"

namespace pqchat::hub {

ConnectionHub::~ConnectionHub() {
    shutdown();
}

ConnectionHub::SlotPtr ConnectionHub::find_slot(RoomId room) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

ConnectionHub::SlotPtr ConnectionHub::get_or_create_slot(RoomId room) {
    if (auto slot = find_slot(room)) {
        return slot;
    }

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto& slot = rooms_[room];
    if (!slot) {
        slot = std::make_shared<RoomSlot>();
    }
    return slot;
}

void ConnectionHub::retire_if_empty(RoomId room, const SlotPtr& slot) {
    // Lock order: registry, then room
    std::unique_lock<std::shared_mutex> registry_lock(registry_mutex_);
    std::lock_guard<std::mutex> slot_lock(slot->mutex);

    auto it = rooms_.find(room);
    if (slot->connections.empty() && it != rooms_.end() && it->second == slot) {
        slot->retired = true;
        rooms_.erase(it);
    }
}

bool ConnectionHub::remove_from_room(RoomId room, const ConnectionPtr& connection) {
    auto slot = find_slot(room);
    if (!slot) {
        return false;
    }

    bool now_empty = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& conns = slot->connections;
        auto it = std::find(conns.begin(), conns.end(), connection);
        if (it == conns.end()) {
            return false;
        }
        conns.erase(it);
        now_empty = conns.empty();
    }

    if (now_empty) {
        retire_if_empty(room, slot);
    }
    return true;
}

void ConnectionHub::connect(const ConnectionPtr& connection, RoomId room) {
    if (!connection) {
        throw std::invalid_argument("Null connection");
    }

    // Lock order: connection membership, registry, room
    std::lock_guard<std::mutex> membership(connection->membership_mutex_);
    if (connection->state() == ConnectionState::CLOSED) {
        throw ConnectionClosed("Connection " + std::to_string(connection->id()) + " is closed");
    }

    auto current = connection->room();
    if (current && *current == room) {
        return;
    }
    if (current) {
        // One room at a time
        remove_from_room(*current, connection);
        spdlog::debug("Connection {} moved from room {} to room {}",
                      connection->id(), *current, room);
    }

    for (;;) {
        auto slot = get_or_create_slot(room);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->retired) {
            // Lost a race with retire_if_empty; pick up the new slot
            continue;
        }
        slot->connections.push_back(connection);
        connection->mark_open(room);
        break;
    }

    ++connects_;
    spdlog::info("Connection {} joined room {}", connection->id(), room);
}

bool ConnectionHub::disconnect(const ConnectionPtr& connection, RoomId room) {
    if (!connection) {
        return false;
    }

    {
        std::lock_guard<std::mutex> membership(connection->membership_mutex_);
        if (!remove_from_room(room, connection)) {
            return false;
        }
        connection->mark_closed();
    }

    ++disconnects_;
    spdlog::info("Connection {} left room {}", connection->id(), room);
    return true;
}

BroadcastResult ConnectionHub::broadcast(std::span<const uint8_t> payload, RoomId room) {
    BroadcastResult result;

    auto slot = find_slot(room);
    if (!slot) {
        return result;
    }

    std::vector<ConnectionPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        snapshot = slot->connections;
    }

    std::vector<ConnectionPtr> failed;
    for (const auto& connection : snapshot) {
        if (!connection->is_open()) {
            continue;
        }
        try {
            connection->send(payload);
            ++result.delivered;
        } catch (const std::exception& e) {
            spdlog::warn("Delivery to connection {} in room {} failed: {}",
                         connection->id(), room, e.what());
            failed.push_back(connection);
        } catch (...) {
            spdlog::warn("Delivery to connection {} in room {} failed: unknown error",
                         connection->id(), room);
            failed.push_back(connection);
        }
    }

    for (const auto& connection : failed) {
        std::lock_guard<std::mutex> membership(connection->membership_mutex_);
        if (remove_from_room(room, connection)) {
            connection->mark_closed();
            ++result.pruned;
        }
    }

    deliveries_ += result.delivered;
    delivery_failures_ += failed.size();
    spdlog::debug("Broadcast to room {}: {} delivered, {} pruned",
                  room, result.delivered, result.pruned);
    return result;
}

void ConnectionHub::shutdown() {
    std::unordered_map<RoomId, SlotPtr> rooms;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        rooms.swap(rooms_);
    }

    size_t closed = 0;
    for (auto& [room, slot] : rooms) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (auto& connection : slot->connections) {
            connection->mark_closed();
            ++closed;
        }
        slot->connections.clear();
        slot->retired = true;
    }

    if (closed > 0) {
        spdlog::info("Hub shut down, closed {} connections", closed);
    }
}

size_t ConnectionHub::connection_count(RoomId room) const {
    auto slot = find_slot(room);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->connections.size();
}

size_t ConnectionHub::room_count() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return rooms_.size();
}

HubStats ConnectionHub::stats() const {
    HubStats stats;
    stats.connects = connects_.load();
    stats.disconnects = disconnects_.load();
    stats.deliveries = deliveries_.load();
    stats.delivery_failures = delivery_failures_.load();
    return stats;
}

}  // namespace pqchat::hub
