#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "pqchat/errors.hpp"
#include "pqchat/hub/chat_event.hpp"
#include "pqchat/hub/connection.hpp"
#include "pqchat/hub/connection_hub.hpp"

namespace pqchat::hub {
namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class MockConnection : public Connection {
public:
    using Connection::Connection;

    MOCK_METHOD(void, send, (std::span<const uint8_t> frame), (override));
};

class ConnectionHubTest : public ::testing::Test {
protected:
    std::shared_ptr<BufferedConnection> make_connection() {
        return std::make_shared<BufferedConnection>(next_id_++);
    }

    ConnectionHub hub_;
    ConnectionId next_id_{1};
    Bytes payload_{0xCA, 0xFE};
};

TEST_F(ConnectionHubTest, NewConnectionIsConnecting) {
    auto conn = make_connection();
    EXPECT_EQ(conn->state(), ConnectionState::CONNECTING);
    EXPECT_FALSE(conn->room().has_value());
    EXPECT_STREQ(connection_state_to_string(conn->state()), "connecting");
}

TEST_F(ConnectionHubTest, ConnectOpens) {
    auto conn = make_connection();
    hub_.connect(conn, 7);

    EXPECT_TRUE(conn->is_open());
    EXPECT_EQ(conn->room(), 7u);
    EXPECT_EQ(hub_.connection_count(7), 1u);
    EXPECT_EQ(hub_.room_count(), 1u);
}

TEST_F(ConnectionHubTest, BroadcastReachesEveryConnectionInRoom) {
    auto a = make_connection();
    auto b = make_connection();
    auto other = make_connection();
    hub_.connect(a, 7);
    hub_.connect(b, 7);
    hub_.connect(other, 8);

    auto result = hub_.broadcast(payload_, 7);
    EXPECT_EQ(result.delivered, 2u);
    EXPECT_EQ(result.pruned, 0u);

    EXPECT_EQ(a->receive(), payload_);
    EXPECT_EQ(b->receive(), payload_);
    EXPECT_FALSE(other->receive().has_value());
}

TEST_F(ConnectionHubTest, BroadcastToUnknownRoomIsNoop) {
    auto result = hub_.broadcast(payload_, 99);
    EXPECT_EQ(result.delivered, 0u);
    EXPECT_EQ(result.pruned, 0u);
}

TEST_F(ConnectionHubTest, ReconnectSameRoomIsNoop) {
    auto conn = make_connection();
    hub_.connect(conn, 7);
    hub_.connect(conn, 7);

    EXPECT_EQ(hub_.connection_count(7), 1u);
    EXPECT_EQ(hub_.broadcast(payload_, 7).delivered, 1u);
    EXPECT_EQ(hub_.stats().connects, 1u);
}

TEST_F(ConnectionHubTest, ConnectToOtherRoomMoves) {
    auto conn = make_connection();
    hub_.connect(conn, 7);
    hub_.connect(conn, 8);

    EXPECT_EQ(conn->room(), 8u);
    EXPECT_EQ(hub_.connection_count(7), 0u);
    EXPECT_EQ(hub_.connection_count(8), 1u);
    EXPECT_EQ(hub_.broadcast(payload_, 7).delivered, 0u);
    EXPECT_EQ(hub_.broadcast(payload_, 8).delivered, 1u);
}

TEST_F(ConnectionHubTest, DisconnectIsIdempotent) {
    auto conn = make_connection();
    hub_.connect(conn, 7);

    EXPECT_TRUE(hub_.disconnect(conn, 7));
    EXPECT_EQ(conn->state(), ConnectionState::CLOSED);
    EXPECT_FALSE(hub_.disconnect(conn, 7));
    EXPECT_FALSE(hub_.disconnect(make_connection(), 7));

    EXPECT_EQ(hub_.connection_count(7), 0u);
    EXPECT_EQ(hub_.room_count(), 0u);
    EXPECT_EQ(hub_.stats().disconnects, 1u);
}

TEST_F(ConnectionHubTest, DisconnectFromWrongRoomIsNoop) {
    auto conn = make_connection();
    hub_.connect(conn, 7);

    EXPECT_FALSE(hub_.disconnect(conn, 8));
    EXPECT_TRUE(conn->is_open());
}

TEST_F(ConnectionHubTest, ClosedConnectionCannotConnect) {
    auto conn = make_connection();
    hub_.connect(conn, 7);
    hub_.disconnect(conn, 7);

    EXPECT_THROW(hub_.connect(conn, 7), ConnectionClosed);
    EXPECT_EQ(hub_.connection_count(7), 0u);
}

TEST_F(ConnectionHubTest, FailedConnectionIsPrunedAndOthersStillServed) {
    auto good = make_connection();
    auto gone = make_connection();
    hub_.connect(good, 7);
    hub_.connect(gone, 7);
    gone->hang_up();

    auto result = hub_.broadcast(payload_, 7);
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(result.pruned, 1u);
    EXPECT_EQ(gone->state(), ConnectionState::CLOSED);
    EXPECT_EQ(hub_.connection_count(7), 1u);
    EXPECT_EQ(good->receive(), payload_);

    // Pruned connection is no longer attempted
    result = hub_.broadcast(payload_, 7);
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(result.pruned, 0u);

    auto stats = hub_.stats();
    EXPECT_EQ(stats.deliveries, 2u);
    EXPECT_EQ(stats.delivery_failures, 1u);
}

TEST_F(ConnectionHubTest, AnySendExceptionPrunes) {
    auto flaky = std::make_shared<NiceMock<MockConnection>>(100);
    auto good = make_connection();
    EXPECT_CALL(*flaky, send(_)).WillOnce(Throw(std::runtime_error("socket reset")));

    hub_.connect(flaky, 7);
    hub_.connect(good, 7);

    auto result = hub_.broadcast(payload_, 7);
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(result.pruned, 1u);
    EXPECT_EQ(flaky->state(), ConnectionState::CLOSED);
}

TEST_F(ConnectionHubTest, NonStandardSendExceptionPrunes) {
    auto odd = std::make_shared<NiceMock<MockConnection>>(101);
    auto good = make_connection();
    EXPECT_CALL(*odd, send(_)).WillOnce(Throw(42));

    hub_.connect(odd, 7);
    hub_.connect(good, 7);

    BroadcastResult result;
    EXPECT_NO_THROW(result = hub_.broadcast(payload_, 7));
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(result.pruned, 1u);
    EXPECT_EQ(odd->state(), ConnectionState::CLOSED);
    EXPECT_EQ(hub_.connection_count(7), 1u);
}

TEST_F(ConnectionHubTest, BlockedSendLeavesRoomOpenForMembershipChanges) {
    auto slow = std::make_shared<NiceMock<MockConnection>>(102);
    std::promise<void> entered;
    std::promise<void> release;
    auto entered_future = entered.get_future();
    std::shared_future<void> released = release.get_future().share();
    EXPECT_CALL(*slow, send(_)).WillOnce([&entered, released](std::span<const uint8_t>) {
        entered.set_value();
        released.wait();
    });
    hub_.connect(slow, 7);

    auto sending = std::async(std::launch::async, [this] { return hub_.broadcast(payload_, 7); });
    entered_future.wait();

    auto other = make_connection();
    auto membership = std::async(std::launch::async, [this, other] {
        hub_.connect(other, 7);
        return hub_.disconnect(other, 7);
    });
    auto status = membership.wait_for(std::chrono::seconds(5));

    release.set_value();
    EXPECT_EQ(status, std::future_status::ready);
    EXPECT_TRUE(membership.get());

    auto result = sending.get();
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(hub_.connection_count(7), 1u);
}

TEST_F(ConnectionHubTest, ConcurrentConnectsOfOneConnectionPickOneRoom) {
    for (int round = 0; round < 500; ++round) {
        auto conn = make_connection();
        std::thread a([&] { hub_.connect(conn, 7); });
        std::thread b([&] { hub_.connect(conn, 8); });
        a.join();
        b.join();

        ASSERT_TRUE(conn->room().has_value());
        RoomId room = *conn->room();
        EXPECT_EQ(hub_.connection_count(room), 1u);
        EXPECT_EQ(hub_.connection_count(room == 7 ? 8 : 7), 0u);

        EXPECT_TRUE(hub_.disconnect(conn, room));
    }
    EXPECT_EQ(hub_.room_count(), 0u);
}

TEST_F(ConnectionHubTest, StalledConnectionIsPruned) {
    auto slow = std::make_shared<BufferedConnection>(50, 2);
    hub_.connect(slow, 7);

    EXPECT_EQ(hub_.broadcast(payload_, 7).delivered, 1u);
    EXPECT_EQ(hub_.broadcast(payload_, 7).delivered, 1u);

    auto result = hub_.broadcast(payload_, 7);
    EXPECT_EQ(result.delivered, 0u);
    EXPECT_EQ(result.pruned, 1u);
    EXPECT_EQ(slow->queued(), 2u);
}

TEST_F(ConnectionHubTest, ShutdownClosesEverything) {
    auto a = make_connection();
    auto b = make_connection();
    hub_.connect(a, 7);
    hub_.connect(b, 8);

    hub_.shutdown();

    EXPECT_EQ(a->state(), ConnectionState::CLOSED);
    EXPECT_EQ(b->state(), ConnectionState::CLOSED);
    EXPECT_EQ(hub_.room_count(), 0u);
}

TEST_F(ConnectionHubTest, ConcurrentConnectBroadcastDisconnect) {
    constexpr int kThreads = 8;
    constexpr int kRounds = 200;
    constexpr RoomId kRoom = 3;

    auto listener = make_connection();
    hub_.connect(listener, kRoom);

    std::atomic<bool> stop{false};
    std::thread broadcaster([&] {
        while (!stop) {
            hub_.broadcast(payload_, kRoom);
            while (listener->receive()) {
            }
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kRounds; ++i) {
                auto conn = std::make_shared<BufferedConnection>(1000 + t * kRounds + i);
                hub_.connect(conn, kRoom + (i % 2));
                hub_.disconnect(conn, kRoom + (i % 2));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    stop = true;
    broadcaster.join();

    EXPECT_EQ(hub_.connection_count(kRoom), 1u);
    EXPECT_EQ(hub_.connection_count(kRoom + 1), 0u);
    EXPECT_TRUE(listener->is_open());
    EXPECT_EQ(hub_.stats().disconnects, static_cast<uint64_t>(kThreads * kRounds));
}

// ChatEvent

TEST(ChatEventTest, EncodeParse) {
    ChatEvent event;
    event.room_id = 0x0102030405060708;
    event.sender_id = 42;
    event.message_id = 9001;
    event.sent_at_ms = 1700000000000;
    event.ciphertext = {1, 2, 3, 4, 5};

    auto frame = encode_event(event);
    ASSERT_EQ(frame.size(), ChatEvent::HEADER_SIZE + 5);
    EXPECT_EQ(frame[0], 0x01);
    EXPECT_EQ(frame[1], 0x01);
    EXPECT_EQ(frame[8], 0x08);

    auto parsed = parse_event(frame);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->type, ChatEventType::NEW_MESSAGE);
    EXPECT_EQ(parsed->room_id, event.room_id);
    EXPECT_EQ(parsed->sender_id, event.sender_id);
    EXPECT_EQ(parsed->message_id, event.message_id);
    EXPECT_EQ(parsed->sent_at_ms, event.sent_at_ms);
    EXPECT_EQ(parsed->ciphertext, event.ciphertext);
}

TEST(ChatEventTest, RejectsMalformedFrames) {
    ChatEvent event;
    event.ciphertext = {1, 2, 3};
    auto frame = encode_event(event);

    Bytes short_frame(frame.begin(), frame.begin() + ChatEvent::HEADER_SIZE - 1);
    EXPECT_FALSE(parse_event(short_frame).has_value());

    auto unknown_type = frame;
    unknown_type[0] = 0x7F;
    EXPECT_FALSE(parse_event(unknown_type).has_value());

    auto truncated = frame;
    truncated.pop_back();
    EXPECT_FALSE(parse_event(truncated).has_value());

    auto trailing = frame;
    trailing.push_back(0x00);
    EXPECT_FALSE(parse_event(trailing).has_value());
}

}  // namespace
}  // namespace pqchat::hub
