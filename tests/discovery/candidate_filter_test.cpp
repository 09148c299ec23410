#include "mx/discovery/candidate_filter.hpp"

#include <gtest/gtest.h>

using namespace mx::discovery;

TEST(CandidateFilterTest, VideoExtensionsAreEligible) {
    EXPECT_TRUE(is_eligible("clip.mp4"));
    EXPECT_TRUE(is_eligible("dir/clip.mkv"));
    EXPECT_TRUE(is_eligible("clip.webm"));
    EXPECT_TRUE(is_eligible("clip.mov"));
    EXPECT_TRUE(is_eligible("clip.avi"));
    EXPECT_TRUE(is_eligible("clip.ts"));
}

TEST(CandidateFilterTest, LookupIsCaseInsensitive) {
    EXPECT_TRUE(is_eligible("CLIP.MP4"));
    EXPECT_EQ(mime_type_for("Trick.MoV").value_or(""), "video/quicktime");
}

TEST(CandidateFilterTest, NonVideoFilesAreRejected) {
    EXPECT_FALSE(is_eligible("notes.txt"));
    EXPECT_FALSE(is_eligible("cover.jpg"));
    EXPECT_FALSE(is_eligible("song.mp3"));
    EXPECT_EQ(mime_type_for("cover.jpg").value_or(""), "image/jpeg");
}

TEST(CandidateFilterTest, UnknownOrMissingExtension) {
    EXPECT_FALSE(mime_type_for("README").has_value());
    EXPECT_FALSE(mime_type_for("archive.xyz").has_value());
    EXPECT_FALSE(mime_type_for("trailing.").has_value());
    EXPECT_FALSE(is_eligible(".mp4"));  // Hidden file, no extension
}
