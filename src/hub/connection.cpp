#include "pqchat/hub/connection.hpp"

#include <string>

#include "pqchat/errors.hpp"

namespace pqchat::hub {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::OPEN: return "open";
        case ConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

Connection::Connection(ConnectionId id) : id_(id) {}

std::optional<RoomId> Connection::room() const {
    std::lock_guard<std::mutex> lock(room_mutex_);
    return room_;
}

void Connection::mark_open(RoomId room) {
    std::lock_guard<std::mutex> lock(room_mutex_);
    room_ = room;
    state_ = ConnectionState::OPEN;
}

void Connection::mark_closed() {
    std::lock_guard<std::mutex> lock(room_mutex_);
    room_.reset();
    state_ = ConnectionState::CLOSED;
}

BufferedConnection::BufferedConnection(ConnectionId id, size_t max_queued)
    : Connection(id), max_queued_(max_queued) {}

void BufferedConnection::send(std::span<const uint8_t> frame) {
    if (hung_up_) {
        throw ConnectionClosed("Connection " + std::to_string(id()) + " hung up");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.size() >= max_queued_) {
        throw ConnectionClosed("Connection " + std::to_string(id()) + " stalled");
    }
    frames_.emplace_back(frame.begin(), frame.end());
}

std::optional<Bytes> BufferedConnection::receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) {
        return std::nullopt;
    }
    Bytes frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void BufferedConnection::hang_up() {
    hung_up_ = true;
}

size_t BufferedConnection::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

}  // namespace pqchat::hub
