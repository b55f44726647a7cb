#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <span>

#include "pqchat/types.hpp"

namespace pqchat::hub {

// Connection lifecycle
enum class ConnectionState {
    CONNECTING,
    OPEN,
    CLOSED
};

const char* connection_state_to_string(ConnectionState state);

class ConnectionHub;

// One live transport session. The hub drives the state machine; the
// transport implements send().
class Connection {
public:
    explicit Connection(ConnectionId id);
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Deliver one frame. Throws (typically ConnectionClosed) on failure.
    virtual void send(std::span<const uint8_t> frame) = 0;

    [[nodiscard]] ConnectionId id() const { return id_; }
    [[nodiscard]] ConnectionState state() const { return state_.load(); }
    [[nodiscard]] bool is_open() const { return state() == ConnectionState::OPEN; }

    // Room the connection is registered under, if any
    [[nodiscard]] std::optional<RoomId> room() const;

private:
    friend class ConnectionHub;

    void mark_open(RoomId room);
    void mark_closed();

    const ConnectionId id_;
    std::atomic<ConnectionState> state_{ConnectionState::CONNECTING};
    // Held by the hub across a whole connect, disconnect or prune
    std::mutex membership_mutex_;
    mutable std::mutex room_mutex_;
    std::optional<RoomId> room_;
};

// In-memory connection that queues frames for the peer to drain
class BufferedConnection : public Connection {
public:
    explicit BufferedConnection(ConnectionId id, size_t max_queued = 1024);

    // Throws ConnectionClosed once the peer hung up or the queue is full
    void send(std::span<const uint8_t> frame) override;

    // Peer side
    std::optional<Bytes> receive();
    void hang_up();

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] bool hung_up() const { return hung_up_.load(); }

private:
    const size_t max_queued_;
    std::atomic<bool> hung_up_{false};
    mutable std::mutex mutex_;
    std::deque<Bytes> frames_;
};

}  // namespace pqchat::hub
