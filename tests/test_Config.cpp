#include <gtest/gtest.h>
#include "app/Config.h"

#include <filesystem>
#include <fstream>

using namespace treenav;
namespace fs = std::filesystem;

TEST(ConfigTest, ParseHexColors) {
    ThemeColor c;
    ASSERT_TRUE(Config::parseColor("#50C8DC", c));
    EXPECT_EQ(c.index, -1);
    EXPECT_NEAR(c.rgb.r, 80 / 255.0f, 1e-5);
    EXPECT_NEAR(c.rgb.g, 200 / 255.0f, 1e-5);
    EXPECT_NEAR(c.rgb.b, 220 / 255.0f, 1e-5);

    ASSERT_TRUE(Config::parseColor("  ff0000 ", c));
    EXPECT_FLOAT_EQ(c.rgb.r, 1.0f);
}

TEST(ConfigTest, ParseNamedColors) {
    ThemeColor c;
    ASSERT_TRUE(Config::parseColor("red", c));
    EXPECT_EQ(c.index, 1);
    ASSERT_TRUE(Config::parseColor("LightBlue", c));
    EXPECT_EQ(c.index, 12);
    ASSERT_TRUE(Config::parseColor("grey", c));
    EXPECT_EQ(c.index, 7);
    ASSERT_TRUE(Config::parseColor("darkgray", c));
    EXPECT_EQ(c.index, 8);
    ASSERT_TRUE(Config::parseColor("white", c));
    EXPECT_EQ(c.index, 15);
}

TEST(ConfigTest, RejectsUnknownColors) {
    ThemeColor c = ThemeColor::named(3);
    EXPECT_FALSE(Config::parseColor("chartreuse", c));
    EXPECT_FALSE(Config::parseColor("#12345", c));
    EXPECT_FALSE(Config::parseColor("", c));
    EXPECT_EQ(c.index, 3);
}

TEST(ConfigTest, FromJsonOverridesOnlyValidKeys) {
    Config& config = Config::instance();
    config.theme = Theme();

    nlohmann::json j = {
        {"theme", {
            {"border", "#000000"},
            {"starred", "not a color"},
            {"text", 42},
            {"dim", "cyan"},
        }},
    };
    config.fromJson(j);

    EXPECT_EQ(config.theme.border.index, -1);
    EXPECT_FLOAT_EQ(config.theme.border.rgb.r, 0.0f);
    EXPECT_EQ(config.theme.dim.index, 6);

    Theme defaults;
    EXPECT_FLOAT_EQ(config.theme.starred.rgb.r, defaults.starred.rgb.r);
    EXPECT_EQ(config.theme.text.index, defaults.text.index);
    EXPECT_FLOAT_EQ(config.theme.highlightBg.rgb.b, defaults.highlightBg.rgb.b);

    config.theme = Theme();
}

TEST(ConfigTest, LoadFromFile) {
    auto tempDir = fs::temp_directory_path() / "treenav_test_config";
    fs::create_directories(tempDir);
    auto path = tempDir / "config.json";
    std::ofstream(path) << R"({"theme": {"highlight_bg": "blue"}})";

    Config& config = Config::instance();
    EXPECT_TRUE(config.loadFrom(path.string()));
    EXPECT_EQ(config.theme.highlightBg.index, 4);

    std::ofstream(path) << "{ broken";
    EXPECT_FALSE(config.loadFrom(path.string()));
    EXPECT_EQ(config.theme.highlightBg.index, -1);

    EXPECT_TRUE(config.loadFrom((tempDir / "missing.json").string()));

    fs::remove_all(tempDir);
    config.theme = Theme();
}
