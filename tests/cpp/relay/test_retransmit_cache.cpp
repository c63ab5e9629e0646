#include "relay/retransmit_cache.h"

#include "fake_peer_connection.h"

#include <gtest/gtest.h>

using relay::RetransmitCache;
using relay_test::makePacket;

TEST(RetransmitCacheTest, FindsBySsrcAndSequence) {
    RetransmitCache cache(8);
    auto packet = makePacket(100, 5, 96);
    cache.insert(packet);

    EXPECT_EQ(cache.find(100, 5), packet);
    EXPECT_EQ(cache.find(100, 6), nullptr);
    EXPECT_EQ(cache.find(101, 5), nullptr);
}

TEST(RetransmitCacheTest, EvictsOldestFirst) {
    RetransmitCache cache(3);
    for (uint16_t seq = 1; seq <= 4; ++seq) {
        cache.insert(makePacket(100, seq, 96));
    }
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.evictions(), 1u);
    EXPECT_EQ(cache.find(100, 1), nullptr);
    EXPECT_NE(cache.find(100, 4), nullptr);
}

TEST(RetransmitCacheTest, DuplicateReplacesWithoutGrowing) {
    RetransmitCache cache(2);
    cache.insert(makePacket(100, 1, 96));
    auto replacement = makePacket(100, 1, 96, 10);
    cache.insert(replacement);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find(100, 1), replacement);
}

TEST(RetransmitCacheTest, KeepsStreamsApart) {
    RetransmitCache cache(8);
    auto video = makePacket(1, 9, 96);
    auto audio = makePacket(2, 9, 111);
    cache.insert(video);
    cache.insert(audio);
    EXPECT_EQ(cache.find(1, 9), video);
    EXPECT_EQ(cache.find(2, 9), audio);
}

TEST(RetransmitCacheTest, ClearDropsEverything) {
    RetransmitCache cache(4);
    cache.insert(makePacket(1, 1, 96));
    cache.insert(nullptr);
    EXPECT_EQ(cache.size(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.find(1, 1), nullptr);
}
