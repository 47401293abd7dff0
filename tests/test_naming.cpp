/**
 * @file test_naming.cpp
 * @brief Unit tests for ArtifactNaming
 */

#include <gtest/gtest.h>
#include "relayq/naming.h"
#include "relayq/errors.h"

namespace relayq {
namespace testing {

class NamingTest : public ::testing::Test {
protected:
    ArtifactNaming naming_{".mp4", "[A-Za-z0-9]+-[A-Za-z]+-[0-9]+"};
};

TEST_F(NamingTest, SafeFileNameReplacesUnsafeCharacters) {
    EXPECT_EQ(naming_.safeFileName("Hello: World?"), "Hello_ World_.mp4");
    EXPECT_EQ(naming_.safeFileName("a/b\\c"), "a_b_c.mp4");
    EXPECT_EQ(naming_.safeFileName("keep.these_chars-ok"), "keep.these_chars-ok.mp4");
}

TEST_F(NamingTest, SafeFileNameKeepsExistingExtension) {
    EXPECT_EQ(naming_.safeFileName("clip.mp4"), "clip.mp4");
    EXPECT_EQ(naming_.safeFileName("CLIP.MP4"), "CLIP.MP4");
}

TEST_F(NamingTest, PayloadFileNameFallsBackToId) {
    DiscoveredItem item;
    item.id = "ABC-XYZ-123";
    EXPECT_EQ(naming_.payloadFileName(item), "ABC-XYZ-123.mp4");

    item.title = "ABC-XYZ-123 Title";
    EXPECT_EQ(naming_.payloadFileName(item), "ABC-XYZ-123 Title.mp4");
}

TEST_F(NamingTest, IdFromFileName) {
    EXPECT_EQ(naming_.idFromFileName("ABC-XYZ-123 Title.mp4"), "ABC-XYZ-123");
    EXPECT_EQ(naming_.idFromFileName("ABC-XYZ-123 Title.mp4.part"), "ABC-XYZ-123");
    EXPECT_EQ(naming_.idFromFileName("[hd] ab1-cd-0042.mp4"), "ab1-cd-0042");
    EXPECT_FALSE(naming_.idFromFileName("holiday video.mp4").has_value());
    EXPECT_FALSE(naming_.idFromFileName("").has_value());
}

TEST_F(NamingTest, IsPayloadFile) {
    EXPECT_TRUE(naming_.isPayloadFile("a.mp4"));
    EXPECT_TRUE(naming_.isPayloadFile("a.MP4"));
    EXPECT_FALSE(naming_.isPayloadFile("a.mp4.part"));
    EXPECT_FALSE(naming_.isPayloadFile("a.txt"));
}

TEST_F(NamingTest, BucketFor) {
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-1234567"), "ABC-XYZ-120");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-123"), "ABC-XYZ-120");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-129"), "ABC-XYZ-120");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-130"), "ABC-XYZ-130");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-12"), "ABC-XYZ-10");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABC-XYZ-7"), "ABC-XYZ-0");
    EXPECT_EQ(ArtifactNaming::bucketFor("ABCXYZ"), "ABCXYZ-0");
}

TEST_F(NamingTest, RemotePathFor) {
    EXPECT_EQ(ArtifactNaming::remotePathFor("ABC-XYZ-1234567", "clip.mp4"),
              "ABC-XYZ-120/clip.mp4");
}

TEST(NamingConstructionTest, InvalidPatternThrows) {
    EXPECT_THROW(ArtifactNaming(".mp4", "([unclosed"), RelayqException);
}

} // namespace testing
} // namespace relayq
