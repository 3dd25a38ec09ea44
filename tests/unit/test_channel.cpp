/**
 * Unit tests for MessageChannel framing over a socketpair
 */

#include <gtest/gtest.h>
#include "../../src/channel.h"
#include "codegate/constants.h"
#include <sys/socket.h>
#include <chrono>
#include <string>
#include <thread>

using namespace codegate;
using namespace std::chrono;

class ChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = MessageChannel::create_pair();
        raw_peer = pair.second.get();
        parent = std::make_unique<MessageChannel>(std::move(pair.first));
        child = std::make_unique<MessageChannel>(std::move(pair.second));
    }

    std::unique_ptr<MessageChannel> parent;
    std::unique_ptr<MessageChannel> child;
    int raw_peer = -1;
};

TEST_F(ChannelTest, MessagesArriveInOrder) {
    // Given
    Json::Value first;
    first["type"] = "call";
    first["operation"] = "list_items";
    Json::Value second;
    second["type"] = "result";
    second["value"] = 42;

    // When
    ASSERT_TRUE(child->send(first));
    ASSERT_TRUE(child->send(second));

    // Then
    Json::Value received;
    ASSERT_EQ(parent->receive(received), ReadStatus::OK);
    EXPECT_EQ(received["operation"].asString(), "list_items");
    ASSERT_EQ(parent->receive(received), ReadStatus::OK);
    EXPECT_EQ(received["value"].asInt(), 42);
}

TEST_F(ChannelTest, ResultAtTheDepthCeilingFitsInAFrame) {
    // Given: a result frame whose value ends in the marker at the deepest allowed level
    Json::Value value(TRUNCATION_MARKER);
    for (size_t i = 0; i < MAX_ALLOWED_RESULT_DEPTH; ++i) {
        Json::Value wrapper(Json::arrayValue);
        wrapper.append(value);
        value = wrapper;
    }
    Json::Value message;
    message["type"] = "result";
    message["value"] = value;

    // When
    ASSERT_TRUE(child->send(message));
    Json::Value received;

    // Then
    ASSERT_EQ(parent->receive(received, steady_clock::now() + seconds(5)), ReadStatus::OK);
    EXPECT_EQ(received["type"].asString(), "result");
}

TEST_F(ChannelTest, OversizedMessagesAreNotSent) {
    Json::Value big;
    big["value"] = std::string(MAX_FRAME_BYTES, 'x');

    EXPECT_GT(MessageChannel::serialize(big).size(), MAX_FRAME_BYTES);
    EXPECT_FALSE(child->send(big));
}

TEST_F(ChannelTest, LargeMessagesSpanManyReads) {
    Json::Value big;
    big["type"] = "result";
    big["value"] = std::string(1024 * 1024, 'x');

    // The socket buffer is smaller than the frame, so send from another thread
    std::thread sender([&] { child->send(big); });
    Json::Value received;
    ReadStatus status = parent->receive(received, steady_clock::now() + seconds(10));
    sender.join();

    ASSERT_EQ(status, ReadStatus::OK);
    EXPECT_EQ(received["value"].asString().size(), 1024u * 1024u);
}

TEST_F(ChannelTest, ReceiveTimesOutAtDeadline) {
    Json::Value received;
    auto start = steady_clock::now();

    ReadStatus status = parent->receive(received, start + milliseconds(100));

    EXPECT_EQ(status, ReadStatus::TIMEOUT);
    EXPECT_GE(steady_clock::now() - start, milliseconds(90));
}

TEST_F(ChannelTest, ClosedPeerIsReported) {
    child.reset();

    Json::Value received;
    EXPECT_EQ(parent->receive(received, steady_clock::now() + seconds(1)), ReadStatus::CLOSED);
    EXPECT_FALSE(parent->send(Json::Value(Json::objectValue)));
}

TEST_F(ChannelTest, OversizedFrameHeaderIsMalformed) {
    const unsigned char header[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    ASSERT_EQ(::send(raw_peer, header, sizeof(header), 0), 4);

    Json::Value received;
    EXPECT_EQ(parent->receive(received, steady_clock::now() + seconds(1)), ReadStatus::MALFORMED);
}

TEST_F(ChannelTest, InvalidJsonPayloadIsMalformed) {
    const char frame[] = {0, 0, 0, 5, 'n', 'o', 't', ' ', '{'};
    ASSERT_EQ(::send(raw_peer, frame, sizeof(frame), 0), static_cast<ssize_t>(sizeof(frame)));

    Json::Value received;
    EXPECT_EQ(parent->receive(received, steady_clock::now() + seconds(1)), ReadStatus::MALFORMED);
}

TEST_F(ChannelTest, NonObjectPayloadIsMalformed) {
    const char frame[] = {0, 0, 0, 2, '4', '2'};
    ASSERT_EQ(::send(raw_peer, frame, sizeof(frame), 0), static_cast<ssize_t>(sizeof(frame)));

    Json::Value received;
    EXPECT_EQ(parent->receive(received, steady_clock::now() + seconds(1)), ReadStatus::MALFORMED);
}
