#include "ids.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

namespace huddle {
namespace {

TEST(RoomTargetTest, StripsPrefix) {
    EXPECT_EQ(ParseRoomTarget("room:alpha"), "alpha");
    EXPECT_EQ(ParseRoomTarget("room:42"), "42");
    EXPECT_EQ(ParseRoomTarget("room:room:nested"), "room:nested");
}

TEST(RoomTargetTest, RejectsMalformedTargets) {
    EXPECT_THROW(ParseRoomTarget("alpha"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget("Room:alpha"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget("room"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget(""), RoomTargetError);
}

TEST(RoomTargetTest, RejectsEmptyOrBlankIds) {
    EXPECT_THROW(ParseRoomTarget("room:"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget("room:a b"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget("room:\talpha"), RoomTargetError);
    EXPECT_THROW(ParseRoomTarget(std::string("room:a\0b", 9)), RoomTargetError);
}

TEST(PeerIdTest, IsThirtyTwoHexCharacters) {
    auto id = GeneratePeerId();
    ASSERT_EQ(id.size(), 32u);
    for (char c : id) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << id;
    }
    EXPECT_EQ(ShortId(id), id.substr(0, 8));
}

TEST(PeerIdTest, DoesNotRepeat) {
    std::unordered_set<PeerId> ids;
    for (int i = 0; i < 10000; ++i) {
        EXPECT_TRUE(ids.insert(GeneratePeerId()).second);
    }
}

} // namespace
} // namespace huddle
