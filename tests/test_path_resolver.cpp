#include <gtest/gtest.h>
#include <transfer/path_resolver.hpp>

using namespace path_resolver;

TEST(PathResolver, NormalizeCollapsesSlashesAndDots) {
    EXPECT_EQ(normalize("a//b/./c"), "a/b/c");
    EXPECT_EQ(normalize("/a/b/../c"), "/a/c");
    EXPECT_EQ(normalize("./"), ".");
    EXPECT_EQ(normalize(""), ".");
    EXPECT_EQ(normalize("//"), "/");
}

TEST(PathResolver, NormalizeKeepsLeadingParentForRelative) {
    EXPECT_EQ(normalize("../x"), "../x");
    EXPECT_EQ(normalize("/../x"), "/x");
}

TEST(PathResolver, PosixJoinAppendsAbsoluteSecondPart) {
    EXPECT_EQ(posix_join("/uploads", "/a.txt"), "/uploads/a.txt");
    EXPECT_EQ(posix_join(".", "a.txt"), "a.txt");
    EXPECT_EQ(posix_join("in", "sub/b.txt"), "in/sub/b.txt");
}

TEST(PathResolver, StripLeadingSlashRemovesExactlyOne) {
    EXPECT_EQ(strip_leading_slash("/a.txt"), "a.txt");
    EXPECT_EQ(strip_leading_slash("//a.txt"), "/a.txt");
    EXPECT_EQ(strip_leading_slash("a.txt"), "a.txt");
}

TEST(PathResolver, ResolveFileAbsoluteWorkdir) {
    auto r = resolve_file("/uploads", "/a.txt");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "uploads/a.txt");
}

TEST(PathResolver, ResolveFileDefaultWorkdir) {
    auto r = resolve_file("", "report.csv");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "report.csv");

    r = resolve_file(".", "/report.csv");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "report.csv");
}

TEST(PathResolver, ResolveFileNormalizesDotSegments) {
    auto r = resolve_file("in/./data/", "../out/x.bin");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "in/out/x.bin");
}

TEST(PathResolver, ResolveFileEmptyNameFails) {
    auto r = resolve_file("/uploads", "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Resolution);

    r = resolve_file("/uploads", "/");
    EXPECT_TRUE(r.is_err());
}

TEST(PathResolver, ResolveFileToDotFails) {
    auto r = resolve_file(".", "./");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Resolution);
}

TEST(PathResolver, ResolveDirectory) {
    EXPECT_EQ(resolve_directory(""), ".");
    EXPECT_EQ(resolve_directory("/data//in/"), "/data/in");
}

TEST(PathResolver, ParentAndBaseName) {
    EXPECT_EQ(parent_directory("a/b/c.txt"), "a/b");
    EXPECT_EQ(parent_directory("c.txt"), ".");
    EXPECT_EQ(parent_directory("/c.txt"), "/");
    EXPECT_EQ(base_name("a/b/c.txt"), "c.txt");
    EXPECT_EQ(base_name("a/b/"), "b");
    EXPECT_EQ(base_name("c.txt"), "c.txt");
}

TEST(PathResolver, LegacyPayloadOverridesFilename) {
    LegacyUpload legacy;
    legacy.filename = "override.txt";
    legacy.data = std::string("x");
    EXPECT_EQ(effective_filename("configured.txt", Payload{legacy}), "override.txt");

    legacy.filename = "";
    EXPECT_EQ(effective_filename("configured.txt", Payload{legacy}), "configured.txt");
    EXPECT_EQ(effective_filename("configured.txt", Payload{std::string("text")}), "configured.txt");
}
