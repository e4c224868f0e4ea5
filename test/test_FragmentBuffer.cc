#include <gtest/gtest.h>

#include "FragmentBuffer.hh"

namespace {
FragmentBuffer::TimePoint t0() { return FragmentBuffer::TimePoint{}; }
}

TEST(FragmentBuffer, CompletesWhenEveryIndexArrived) {
    FragmentBuffer buffer(3, 6, t0());
    EXPECT_TRUE(buffer.store(2, {5, 6}));
    EXPECT_TRUE(buffer.store(0, {1, 2}));
    EXPECT_FALSE(buffer.is_complete());
    EXPECT_TRUE(buffer.store(1, {3, 4}));
    EXPECT_TRUE(buffer.is_complete());

    std::vector<uint8_t> out;
    ASSERT_TRUE(buffer.assemble(out));
    EXPECT_EQ(out, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6}));
}

TEST(FragmentBuffer, DuplicateOverwritesWithoutCounting) {
    FragmentBuffer buffer(2, 4, t0());
    EXPECT_TRUE(buffer.store(0, {1, 1}));
    EXPECT_TRUE(buffer.has_slot(0));
    EXPECT_FALSE(buffer.has_slot(1));
    EXPECT_FALSE(buffer.store(0, {2, 2, 2}));
    EXPECT_EQ(buffer.received_count(), 1u);
    EXPECT_EQ(buffer.buffered_bytes(), 3u);
    EXPECT_FALSE(buffer.is_complete());

    // Last write wins, and restoring the right length makes the message assemble
    EXPECT_FALSE(buffer.store(0, {2, 2}));
    EXPECT_TRUE(buffer.store(1, {3, 3}));
    std::vector<uint8_t> out;
    ASSERT_TRUE(buffer.assemble(out));
    EXPECT_EQ(out, (std::vector<uint8_t>{2, 2, 3, 3}));
}

TEST(FragmentBuffer, AssembleFailsOnSizeMismatch) {
    FragmentBuffer buffer(2, 10, t0());
    buffer.store(0, {1, 2, 3});
    buffer.store(1, {4});
    ASSERT_TRUE(buffer.is_complete());
    std::vector<uint8_t> out;
    EXPECT_FALSE(buffer.assemble(out));
}

TEST(FragmentBuffer, MatchesComparesCountAndSize) {
    FragmentBuffer buffer(4, 100, t0());
    FragmentHeader header;
    header.fragment_count = 4;
    header.total_size = 100;
    EXPECT_TRUE(buffer.matches(header));
    header.fragment_count = 5;
    EXPECT_FALSE(buffer.matches(header));
    header.fragment_count = 4;
    header.total_size = 99;
    EXPECT_FALSE(buffer.matches(header));
}
