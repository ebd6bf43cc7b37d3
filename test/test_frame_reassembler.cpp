/**
 * @file test_frame_reassembler.cpp
 * @brief Reassembly and recovery from out-of-sequence frames
 */

#include <gtest/gtest.h>

#include "FrameReassembler.h"

#include <string>
#include <vector>

using namespace Tapir::BLE;

namespace {

Bytes text(const std::string& s) {
    return Bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Bytes first(const std::string& chunk, uint16_t total) {
    return FrameCodec::createFrame(Fragment::CATEGORY, Fragment::FIRST, total, text(chunk));
}

Bytes cont(const std::string& chunk) {
    return FrameCodec::createFrame(Fragment::CATEGORY, Fragment::CONTINUE, 0, text(chunk));
}

Bytes last(const std::string& chunk) {
    return FrameCodec::createFrame(Fragment::CATEGORY, Fragment::LAST, 0, text(chunk));
}

Bytes complete(const std::string& chunk) {
    return FrameCodec::createFrame(Fragment::CATEGORY, Fragment::COMPLETE,
                                   static_cast<uint16_t>(chunk.size()), text(chunk));
}

class FrameReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        reassembler.setReassemblyCallback([this](const Bytes& message) {
            messages.push_back(message.toString());
        });
        reassembler.setDropCallback([this](const std::string& reason) {
            drops.push_back(reason);
        });
    }

    FrameReassembler reassembler;
    std::vector<std::string> messages;
    std::vector<std::string> drops;
};

} // namespace

TEST_F(FrameReassemblerTest, CompleteFrameDeliversImmediately) {
    EXPECT_TRUE(reassembler.processFrame(complete("hello")));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("hello", messages[0]);
    EXPECT_FALSE(reassembler.hasPending());
}

TEST_F(FrameReassemblerTest, FirstContinueLast) {
    EXPECT_TRUE(reassembler.processFrame(first("abc", 9)));
    EXPECT_TRUE(reassembler.hasPending());
    EXPECT_EQ(9u, reassembler.expectedLength());

    EXPECT_TRUE(reassembler.processFrame(cont("def")));
    EXPECT_EQ(6u, reassembler.pendingBytes());
    EXPECT_TRUE(messages.empty());

    EXPECT_TRUE(reassembler.processFrame(last("ghi")));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("abcdefghi", messages[0]);
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(1u, reassembler.stats().messages_completed);
}

TEST_F(FrameReassemblerTest, FirstMidReassemblyRestarts) {
    reassembler.processFrame(first("old", 10));
    reassembler.processFrame(cont("xxx"));

    EXPECT_FALSE(reassembler.processFrame(first("new", 6)));
    EXPECT_TRUE(reassembler.hasPending());
    EXPECT_EQ(6u, reassembler.expectedLength());

    reassembler.processFrame(last("msg"));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("newmsg", messages[0]);
    EXPECT_EQ(1u, reassembler.stats().discarded_partials);
}

TEST_F(FrameReassemblerTest, CompleteMidReassemblyDiscardsPartial) {
    reassembler.processFrame(first("part", 10));
    EXPECT_TRUE(reassembler.processFrame(complete("whole")));

    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("whole", messages[0]);
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(1u, reassembler.stats().discarded_partials);

    // The tail of the abandoned message is now stray
    EXPECT_FALSE(reassembler.processFrame(last("tail!!")));
    EXPECT_EQ(1u, reassembler.stats().dropped_frames);
}

TEST_F(FrameReassemblerTest, StrayContinueAndLastAreDropped) {
    EXPECT_FALSE(reassembler.processFrame(cont("abc")));
    EXPECT_FALSE(reassembler.processFrame(last("abc")));
    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(2u, reassembler.stats().dropped_frames);
    EXPECT_EQ(2u, drops.size());
}

TEST_F(FrameReassemblerTest, OverflowDropsBuffer) {
    reassembler.processFrame(first("abc", 5));
    EXPECT_FALSE(reassembler.processFrame(cont("defg")));
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(1u, reassembler.stats().discarded_partials);
    EXPECT_EQ(1u, reassembler.stats().dropped_frames);
    EXPECT_TRUE(messages.empty());
}

TEST_F(FrameReassemblerTest, ShortLastDropsBuffer) {
    reassembler.processFrame(first("abc", 8));
    EXPECT_FALSE(reassembler.processFrame(last("de")));
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(1u, reassembler.stats().discarded_partials);
}

TEST_F(FrameReassemblerTest, FirstLargerThanDeclaredIsDropped) {
    EXPECT_FALSE(reassembler.processFrame(first("abcdef", 3)));
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(1u, reassembler.stats().dropped_frames);
}

TEST_F(FrameReassemblerTest, ForeignCategoryIsDropped) {
    Bytes foreign = FrameCodec::createFrame(0x42, Fragment::COMPLETE, 2, text("hi"));
    EXPECT_FALSE(reassembler.processFrame(foreign));
    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(1u, reassembler.stats().dropped_frames);
}

TEST_F(FrameReassemblerTest, MalformedFrameIsCounted) {
    const uint8_t raw[] = {0x1F};
    EXPECT_FALSE(reassembler.processFrame(Bytes(raw, sizeof(raw))));
    EXPECT_EQ(1u, reassembler.stats().malformed_frames);
    ASSERT_EQ(1u, drops.size());
}

TEST_F(FrameReassemblerTest, RecoversAfterErrors) {
    reassembler.processFrame(cont("junk"));
    reassembler.processFrame(first("ab", 4));
    reassembler.processFrame(last("cd"));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("abcd", messages[0]);
}

TEST_F(FrameReassemblerTest, StaleBufferTimesOut) {
    reassembler.setTimeout(-1.0);
    reassembler.processFrame(first("abc", 10));
    reassembler.checkTimeouts();
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(1u, reassembler.stats().timeouts);
}

TEST_F(FrameReassemblerTest, FreshBufferSurvivesTimeoutCheck) {
    reassembler.setTimeout(60.0);
    reassembler.processFrame(first("abc", 10));
    reassembler.checkTimeouts();
    EXPECT_TRUE(reassembler.hasPending());
    EXPECT_EQ(0u, reassembler.stats().timeouts);
}

TEST_F(FrameReassemblerTest, ClearDropsPendingSilently) {
    reassembler.processFrame(first("abc", 10));
    reassembler.clear();
    EXPECT_FALSE(reassembler.hasPending());
    EXPECT_EQ(0u, reassembler.stats().discarded_partials);
}
