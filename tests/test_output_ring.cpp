#include <gtest/gtest.h>
#include <managers/output_ring.hpp>

TEST(OutputRing, SequenceStartsAtOne) {
    OutputRing ring;
    EXPECT_EQ(ring.last_seq(), 0u);
    EXPECT_EQ(ring.append("a"), 1u);
    EXPECT_EQ(ring.append("b"), 2u);
    EXPECT_EQ(ring.last_seq(), 2u);
}

TEST(OutputRing, SinceReturnsNewerChunksOnly) {
    OutputRing ring;
    ring.append("one");
    ring.append("two");
    ring.append("three");

    auto snap = ring.since(1);
    EXPECT_EQ(snap.last_seq, 3u);
    ASSERT_EQ(snap.chunks.size(), 2u);
    EXPECT_EQ(snap.chunks[0].seq, 2u);
    EXPECT_EQ(snap.chunks[0].data, "two");
    EXPECT_TRUE(ring.since(3).chunks.empty());
}

TEST(OutputRing, EvictsOldestPastCap) {
    OutputRing ring(10);
    ring.append("aaaa");
    ring.append("bbbb");
    ring.append("cccc");
    EXPECT_LE(ring.size_bytes(), 10u);
    auto snap = ring.since(0);
    ASSERT_EQ(snap.chunks.size(), 2u);
    EXPECT_EQ(snap.chunks[0].seq, 2u);
    EXPECT_EQ(snap.last_seq, 3u);
}

TEST(OutputRing, OversizedChunkIsKept) {
    OutputRing ring(4);
    ring.append("ab");
    ring.append("0123456789");
    EXPECT_EQ(ring.chunk_count(), 1u);
    EXPECT_EQ(ring.since(0).chunks[0].data, "0123456789");
}
