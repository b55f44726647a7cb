#pragma once

#include <cstdint>
#include <vector>

namespace pqchat {

using UserId = uint64_t;
using RoomId = uint64_t;
using MessageId = uint64_t;
using ConnectionId = uint64_t;
using KeyEpoch = uint32_t;

// Opaque byte blob (public keys, envelopes, frames)
using Bytes = std::vector<uint8_t>;

// Only one epoch exists per room; no rotation is modelled
constexpr KeyEpoch INITIAL_EPOCH = 1;

}  // namespace pqchat
