#include <gtest/gtest.h>
#include "core/PlatformUtils.h"

#include <clocale>
#include <cstdlib>
#include <string>

using namespace treenav;

TEST(PlatformUtilsTest, FormatSize) {
    EXPECT_EQ(PlatformUtils::formatSize(0), "0B");
    EXPECT_EQ(PlatformUtils::formatSize(512), "512B");
    EXPECT_EQ(PlatformUtils::formatSize(1023), "1023B");
    EXPECT_EQ(PlatformUtils::formatSize(1024), "1.0K");
    EXPECT_EQ(PlatformUtils::formatSize(1536), "1.5K");
    EXPECT_EQ(PlatformUtils::formatSize(2ull * 1024 * 1024), "2.0M");
    EXPECT_EQ(PlatformUtils::formatSize(3ull * 1024 * 1024 * 1024), "3.0G");
}

TEST(PlatformUtilsTest, BaseName) {
    EXPECT_EQ(PlatformUtils::baseName("/home/user/src"), "src");
    EXPECT_EQ(PlatformUtils::baseName("/home/user/src/"), "src");
    EXPECT_EQ(PlatformUtils::baseName("file.txt"), "file.txt");
    EXPECT_EQ(PlatformUtils::baseName("/"), "/");
}

TEST(PlatformUtilsTest, IsHidden) {
    EXPECT_TRUE(PlatformUtils::isHidden("/a/.git"));
    EXPECT_FALSE(PlatformUtils::isHidden("/a/.git/config"));
    EXPECT_FALSE(PlatformUtils::isHidden("/a/b"));
}

TEST(PlatformUtilsTest, LessIgnoreCaseFoldsAsciiOnly) {
    // Non-ASCII bytes compare as raw bytes: 0xC3 0x84 (Ä) sorts before 0xC3 0xA4 (ä)
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("\xc3\x84pfel", "\xc3\xa4pfel"));
    EXPECT_FALSE(PlatformUtils::lessIgnoreCase("\xc3\xa4pfel", "\xc3\x84pfel"));
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("_x", "Ax"));

    // A single-byte locale must not change the order
    std::string saved = std::setlocale(LC_CTYPE, nullptr);
    if (!std::setlocale(LC_CTYPE, "en_US.ISO-8859-1") && !std::setlocale(LC_CTYPE, "de_DE.ISO-8859-1")) {
        GTEST_SKIP() << "no ISO-8859-1 locale installed";
    }
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("\xc4", "\xe0"));
    EXPECT_FALSE(PlatformUtils::lessIgnoreCase("\xe0", "\xc4"));
    std::setlocale(LC_CTYPE, saved.c_str());
}

TEST(PlatformUtilsTest, LessIgnoreCase) {
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("apple", "Banana"));
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("Apple", "banana"));
    EXPECT_FALSE(PlatformUtils::lessIgnoreCase("Zed", "alpha"));
    EXPECT_TRUE(PlatformUtils::lessIgnoreCase("abc", "abcd"));
    EXPECT_FALSE(PlatformUtils::lessIgnoreCase("ABC", "abc"));
    EXPECT_FALSE(PlatformUtils::lessIgnoreCase("abc", "ABC"));
}

TEST(PlatformUtilsTest, IsWithinComparesWholeComponents) {
    EXPECT_TRUE(PlatformUtils::isWithin("/a/b", "/a/b"));
    EXPECT_TRUE(PlatformUtils::isWithin("/a/b/c", "/a/b"));
    EXPECT_FALSE(PlatformUtils::isWithin("/a/bc", "/a/b"));
    EXPECT_FALSE(PlatformUtils::isWithin("/a", "/a/b"));
    EXPECT_TRUE(PlatformUtils::isWithin("/etc", "/"));
}

TEST(PlatformUtilsTest, DecodeUtf8) {
    EXPECT_EQ(PlatformUtils::decodeUtf8("abc"), U"abc");
    EXPECT_EQ(PlatformUtils::decodeUtf8("caf\xc3\xa9"), U"caf\u00e9");
    EXPECT_EQ(PlatformUtils::decodeUtf8("\xe2\x98\x85"), U"\u2605");

    // Stray continuation byte and truncated sequence
    EXPECT_EQ(PlatformUtils::decodeUtf8("a\x80" "b"), U"a\uFFFDb");
    EXPECT_EQ(PlatformUtils::decodeUtf8("a\xc3"), U"a\uFFFD");
}

TEST(PlatformUtilsTest, EncodeUtf8) {
    EXPECT_EQ(PlatformUtils::encodeUtf8(U'a'), "a");
    EXPECT_EQ(PlatformUtils::encodeUtf8(0xE9), "\xc3\xa9");
    EXPECT_EQ(PlatformUtils::encodeUtf8(0x2605), "\xe2\x98\x85");
    EXPECT_EQ(PlatformUtils::encodeUtf8(0x1F4CC), "\xf0\x9f\x93\x8c");
}

TEST(PlatformUtilsTest, FitToWidthAscii) {
    EXPECT_EQ(PlatformUtils::fitToWidth("hello world", 5), "hello");
    EXPECT_EQ(PlatformUtils::fitToWidth("hi", 10), "hi");
    EXPECT_EQ(PlatformUtils::fitToWidth("hi", 0), "");
    EXPECT_EQ(PlatformUtils::displayWidth("hello"), 5);
}

TEST(PlatformUtilsTest, HexColors) {
    RGBcolor c;
    ASSERT_TRUE(PlatformUtils::hex2rgb("#FF0000", c));
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);

    ASSERT_TRUE(PlatformUtils::hex2rgb("50c8dc", c));
    EXPECT_NEAR(c.r, 80 / 255.0f, 1e-5);
    EXPECT_NEAR(c.g, 200 / 255.0f, 1e-5);
    EXPECT_NEAR(c.b, 220 / 255.0f, 1e-5);

    EXPECT_FALSE(PlatformUtils::hex2rgb("#12345", c));
    EXPECT_FALSE(PlatformUtils::hex2rgb("#GG0000", c));
    EXPECT_FALSE(PlatformUtils::hex2rgb("", c));
}

#if !defined(__APPLE__)
TEST(PlatformUtilsTest, DataDirHonoursAbsoluteXdgPath) {
    const char* saved = std::getenv("XDG_DATA_HOME");
    std::string savedValue = saved ? saved : "";

    setenv("XDG_DATA_HOME", "/tmp/treenav_xdg", 1);
    EXPECT_EQ(PlatformUtils::dataDir(), "/tmp/treenav_xdg");

    // Relative values are ignored
    setenv("XDG_DATA_HOME", "relative/dir", 1);
    EXPECT_NE(PlatformUtils::dataDir(), "relative/dir");

    if (saved) {
        setenv("XDG_DATA_HOME", savedValue.c_str(), 1);
    } else {
        unsetenv("XDG_DATA_HOME");
    }
}
#endif
