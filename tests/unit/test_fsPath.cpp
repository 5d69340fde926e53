#include <gtest/gtest.h>
#include "util/fsPath.hpp"

using namespace sk::util;

TEST(FsPathTest, JoinPutsExactlyOneSlashAtTheSeam) {
    EXPECT_EQ(joinPath("/m", "b/k"), "/m/b/k");
    EXPECT_EQ(joinPath("/m/", "b/k"), "/m/b/k");
    EXPECT_EQ(joinPath("/m", "/b/k"), "/m/b/k");
    EXPECT_EQ(joinPath("/m/", "/b/k"), "/m/b/k");
}

TEST(FsPathTest, JoinWithEmptySide) {
    EXPECT_EQ(joinPath("", "b/k"), "b/k");
    EXPECT_EQ(joinPath("/m/", ""), "/m/");
    EXPECT_EQ(joinPath("", ""), "");
}

TEST(FsPathTest, JoinKeepsSchemeSlashes) {
    EXPECT_EQ(joinPath("s3://bucket/root/", "name"), "s3://bucket/root/name");
    EXPECT_EQ(joinPath("s3://bucket/root", "name", "__X__"), "s3://bucket/root/name/__X__");
}

TEST(FsPathTest, StripPrefix) {
    EXPECT_EQ(stripPrefix("s3://bucket/k", "s3://"), "bucket/k");
    EXPECT_EQ(stripPrefix("s3://bucket/k", ""), "s3://bucket/k");
    EXPECT_THROW(stripPrefix("gs://bucket/k", "s3://"), std::invalid_argument);
}

TEST(FsPathTest, ReplacePrefix) {
    EXPECT_EQ(replacePrefix("s3://bucket/a/b", "s3://", "/mnt"), "/mnt/bucket/a/b");
    EXPECT_EQ(replacePrefix("s3://bucket/a/b", "s3://bucket/", "/mnt/"), "/mnt/a/b");
    EXPECT_EQ(replacePrefix("s3://bucket/a/b", "s3://", ""), "bucket/a/b");
    EXPECT_THROW(replacePrefix("s3://bucket/a/b", "s3://other/", "/mnt"), std::invalid_argument);
}
