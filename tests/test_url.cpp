#include "dirmirror/url.hpp"

#include <gtest/gtest.h>

using namespace dirmirror;

TEST(UrlTest, NavigationalHrefsAreExcluded) {
    EXPECT_TRUE(isExcludedHref(""));
    EXPECT_TRUE(isExcludedHref("../"));
    EXPECT_TRUE(isExcludedHref("?C=N;O=D"));
    EXPECT_TRUE(isExcludedHref("http://example.com/file"));
    EXPECT_TRUE(isExcludedHref("https://example.com/"));
    EXPECT_TRUE(isExcludedHref("HTTPS://example.com/"));
    EXPECT_TRUE(isExcludedHref("/pub/"));
    EXPECT_TRUE(isExcludedHref("#top"));
    EXPECT_TRUE(isExcludedHref("mailto:admin@example.com"));
    EXPECT_TRUE(isExcludedHref("ftp://mirror/file"));
}

TEST(UrlTest, ContentHrefsAreKept) {
    EXPECT_FALSE(isExcludedHref("a.txt"));
    EXPECT_FALSE(isExcludedHref("sub/"));
    EXPECT_FALSE(isExcludedHref("my%20file.tar.gz"));
    EXPECT_FALSE(isExcludedHref("..hidden"));
}

TEST(UrlTest, PercentDecodeKeepsPlus) {
    EXPECT_EQ(percentDecode("my%20dir"), "my dir");
    EXPECT_EQ(percentDecode("%E6%96%87%E4%BB%B6.txt"), "\xE6\x96\x87\xE4\xBB\xB6.txt");
    EXPECT_EQ(percentDecode("a+b"), "a+b");
    EXPECT_EQ(percentDecode(""), "");
}

TEST(UrlTest, UnsafeSegmentsAreRejected) {
    EXPECT_TRUE(isSafePathSegment("b.txt"));
    EXPECT_TRUE(isSafePathSegment("..hidden"));
    EXPECT_FALSE(isSafePathSegment(""));
    EXPECT_FALSE(isSafePathSegment("."));
    EXPECT_FALSE(isSafePathSegment(".."));
    EXPECT_FALSE(isSafePathSegment("a/b"));
    EXPECT_FALSE(isSafePathSegment("a\\b"));
    EXPECT_FALSE(isSafePathSegment(std::string("a\0b", 3)));
}

TEST(UrlTest, JoinUrlUsesExactlyOneSlash) {
    EXPECT_EQ(joinUrl("http://h/pub", "a.txt"), "http://h/pub/a.txt");
    EXPECT_EQ(joinUrl("http://h/pub/", "a.txt"), "http://h/pub/a.txt");
    EXPECT_EQ(joinUrl("http://h/pub/", "./sub/"), "http://h/pub/sub/");
    EXPECT_EQ(withTrailingSlash("http://h/pub"), "http://h/pub/");
    EXPECT_EQ(withoutTrailingSlash("http://h/pub//"), "http://h/pub");
}

TEST(UrlTest, LastPathSegment) {
    EXPECT_EQ(lastPathSegment("http://h/pub/data/"), "data");
    EXPECT_EQ(lastPathSegment("http://h/pub/file%20one.iso"), "file%20one.iso");
    EXPECT_EQ(lastPathSegment("http://h/pub/file.iso?x=1#frag"), "file.iso");
    EXPECT_EQ(lastPathSegment("http://h"), "");
    EXPECT_EQ(lastPathSegment("http://h/"), "");
    EXPECT_EQ(lastPathSegment("releases/v1"), "v1");
}

TEST(UrlTest, HostAndValidation) {
    EXPECT_EQ(hostOf("http://user:pw@mirror.example.org:8080/pub"), "mirror.example.org");
    EXPECT_EQ(hostOf("http://[::1]:8000/"), "::1");
    EXPECT_EQ(hostOf("not a url"), "");
    EXPECT_TRUE(hasSchemeAndHost("http://127.0.0.1:8000"));
    EXPECT_FALSE(hasSchemeAndHost("127.0.0.1:8000/pub"));
    EXPECT_FALSE(hasSchemeAndHost("http://"));
    EXPECT_FALSE(hasSchemeAndHost("://host"));
}
