#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "pqchat/hub/connection.hpp"
#include "pqchat/types.hpp"

namespace pqchat::hub {

// Outcome of one broadcast
struct BroadcastResult {
    size_t delivered{0};
    size_t pruned{0};
};

// Cumulative hub statistics
struct HubStats {
    uint64_t connects{0};
    uint64_t disconnects{0};
    uint64_t deliveries{0};
    uint64_t delivery_failures{0};
};

// Tracks live connections per room and fans payloads out to them.
//
// Each room has its own lock; the registry lock is only held to look up,
// create or retire a room slot. Broadcast snapshots the room under its lock
// and sends after releasing it, so a stalled connection never blocks
// connect/disconnect on the same room.
class ConnectionHub {
public:
    using ConnectionPtr = std::shared_ptr<Connection>;

    ConnectionHub() = default;
    ~ConnectionHub();

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    // Register under room and open. A connection open in another room is
    // moved. Throws ConnectionClosed for a closed connection.
    void connect(const ConnectionPtr& connection, RoomId room);

    // Deregister and close. Returns false (no-op) if not registered there.
    bool disconnect(const ConnectionPtr& connection, RoomId room);

    // Deliver payload to every open connection of the room. Failed
    // connections are closed and pruned; individual failures never raise.
    BroadcastResult broadcast(std::span<const uint8_t> payload, RoomId room);

    // Close every connection; used at process teardown
    void shutdown();

    [[nodiscard]] size_t connection_count(RoomId room) const;
    [[nodiscard]] size_t room_count() const;
    [[nodiscard]] HubStats stats() const;

private:
    struct RoomSlot {
        std::mutex mutex;
        std::vector<ConnectionPtr> connections;
        bool retired{false};
    };
    using SlotPtr = std::shared_ptr<RoomSlot>;

    SlotPtr find_slot(RoomId room) const;
    SlotPtr get_or_create_slot(RoomId room);
    bool remove_from_room(RoomId room, const ConnectionPtr& connection);
    void retire_if_empty(RoomId room, const SlotPtr& slot);

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<RoomId, SlotPtr> rooms_;

    std::atomic<uint64_t> connects_{0};
    std::atomic<uint64_t> disconnects_{0};
    std::atomic<uint64_t> deliveries_{0};
    std::atomic<uint64_t> delivery_failures_{0};
};

}  // namespace pqchat::hub
