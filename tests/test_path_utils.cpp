#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, IsStdinName) {
    EXPECT_TRUE(chunkio::IsStdinName("-"));
    EXPECT_FALSE(chunkio::IsStdinName("--"));
    EXPECT_FALSE(chunkio::IsStdinName("/dev/stdin"));
    EXPECT_FALSE(chunkio::IsStdinName(""));
}

TEST(PathUtilsTest, FileExtensionOfLastElement) {
    EXPECT_EQ(chunkio::FileExtension("data.rdf.gz"), ".gz");
    EXPECT_EQ(chunkio::FileExtension("/var/lib/export/g01.json.gz"), ".gz");
    EXPECT_EQ(chunkio::FileExtension("archive.gzip"), ".gzip");
    EXPECT_EQ(chunkio::FileExtension("dir.gz/plain"), "");
    EXPECT_EQ(chunkio::FileExtension("trailing."), ".");
    EXPECT_EQ(chunkio::FileExtension("/dev/stdin"), "");
    EXPECT_EQ(chunkio::FileExtension(""), "");
}
