#include <gtest/gtest.h>
#include "core/Preview.h"
#include "core/Types.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace treenav;
namespace fs = std::filesystem;

class PreviewTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("treenav_test_preview_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "Sub");
        fs::create_directories(dir_ / "another");
        std::ofstream(dir_ / "b.txt") << "b";
        std::ofstream(dir_ / "A.txt") << "a";
        std::ofstream(dir_ / ".hidden") << "h";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(PreviewTest, EmptySelectionShowsPlaceholder) {
    PreviewContent content = Preview::build("", false);
    EXPECT_EQ(content.title, "Preview");
    ASSERT_EQ(content.lines.size(), 1u);
    EXPECT_EQ(content.lines[0], "Select a file or directory");
}

TEST_F(PreviewTest, DirectoryListsDirsFirst) {
    PreviewContent content = Preview::build(dir_.string(), false);
    EXPECT_EQ(content.title, dir_.filename().string());
    std::vector<std::string> expected = {"another/", "Sub/", "A.txt", "b.txt"};
    EXPECT_EQ(content.lines, expected);

    content = Preview::build(dir_.string(), true);
    EXPECT_EQ(content.lines.size(), 5u);
    EXPECT_EQ(content.lines.front(), "another/");
    EXPECT_EQ(content.lines[2], ".hidden");
}

TEST_F(PreviewTest, FileShowsFirstLines) {
    {
        std::ofstream ofs(dir_ / "long.txt");
        for (int i = 0; i < 150; ++i) {
            ofs << "line " << i << "\r\n";
        }
    }

    PreviewContent content = Preview::build((dir_ / "long.txt").string(), false);
    EXPECT_EQ(content.title, "long.txt");
    ASSERT_EQ(content.lines.size(), static_cast<size_t>(PREVIEW_MAX_LINES));
    EXPECT_EQ(content.lines[0], "line 0");
    EXPECT_EQ(content.lines[99], "line 99");
}

TEST_F(PreviewTest, UnreadableFile) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    fs::path locked = dir_ / "locked.txt";
    std::ofstream(locked) << "secret";
    fs::permissions(locked, fs::perms::none);

    PreviewContent content = Preview::build(locked.string(), false);
    ASSERT_EQ(content.lines.size(), 1u);
    EXPECT_EQ(content.lines[0], "[Unable to read file]");
}

TEST_F(PreviewTest, MissingPathShowsPlaceholder) {
    PreviewContent content = Preview::build((dir_ / "gone").string(), false);
    EXPECT_EQ(content.title, "Preview");
}
