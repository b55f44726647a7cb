#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "pqchat/types.hpp"

namespace pqchat::hub {

// Push frame types
enum class ChatEventType : uint8_t {
    NEW_MESSAGE = 0x01
};

// Frame pushed to room members when a message is stored.
//
// Wire format (big-endian):
// [type: 1][room_id: 8][sender_id: 8][message_id: 8][sent_at_ms: 8][length: 4][ciphertext: length]
struct ChatEvent {
    static constexpr size_t HEADER_SIZE = 1 + 8 + 8 + 8 + 8 + 4;

    ChatEventType type{ChatEventType::NEW_MESSAGE};
    RoomId room_id{0};
    UserId sender_id{0};
    MessageId message_id{0};
    uint64_t sent_at_ms{0};
    Bytes ciphertext;
};

Bytes encode_event(const ChatEvent& event);

// Returns nullopt for a short frame, unknown type or mismatched length
std::optional<ChatEvent> parse_event(std::span<const uint8_t> data);

}  // namespace pqchat::hub
