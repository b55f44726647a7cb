#include "pqchat/hub/chat_event.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace pqchat::hub {

namespace {

void write_u64(uint8_t* data, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        data[i] = static_cast<uint8_t>(value);
        value >>= 8;
    }
}

void write_u32(uint8_t* data, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        data[i] = static_cast<uint8_t>(value);
        value >>= 8;
    }
}

uint64_t read_u64(std::span<const uint8_t> data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint32_t read_u32(std::span<const uint8_t> data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

}  // namespace

Bytes encode_event(const ChatEvent& event) {
    if (event.ciphertext.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Event payload too large");
    }

    Bytes frame(ChatEvent::HEADER_SIZE + event.ciphertext.size());
    uint8_t* p = frame.data();

    p[0] = static_cast<uint8_t>(event.type);
    write_u64(p + 1, event.room_id);
    write_u64(p + 9, event.sender_id);
    write_u64(p + 17, event.message_id);
    write_u64(p + 25, event.sent_at_ms);
    write_u32(p + 33, static_cast<uint32_t>(event.ciphertext.size()));

    std::copy(event.ciphertext.begin(), event.ciphertext.end(), frame.begin() + ChatEvent::HEADER_SIZE);
    return frame;
}

std::optional<ChatEvent> parse_event(std::span<const uint8_t> data) {
    if (data.size() < ChatEvent::HEADER_SIZE) {
        return std::nullopt;
    }
    if (data[0] != static_cast<uint8_t>(ChatEventType::NEW_MESSAGE)) {
        return std::nullopt;
    }

    uint32_t length = read_u32(data.subspan(33, 4));
    if (data.size() - ChatEvent::HEADER_SIZE != length) {
        return std::nullopt;
    }

    ChatEvent event;
    event.type = ChatEventType::NEW_MESSAGE;
    event.room_id = read_u64(data.subspan(1, 8));
    event.sender_id = read_u64(data.subspan(9, 8));
    event.message_id = read_u64(data.subspan(17, 8));
    event.sent_at_ms = read_u64(data.subspan(25, 8));
    event.ciphertext.assign(data.begin() + ChatEvent::HEADER_SIZE, data.end());
    return event;
}

}  // namespace pqchat::hub
