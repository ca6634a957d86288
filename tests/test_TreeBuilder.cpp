#include <gtest/gtest.h>
#include "core/TreeBuilder.h"
#include "core/Icons.h"
#include "search/SearchIndex.h"
#include "size/SizeCache.h"
#include "state/PersistentState.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace treenav;
namespace fs = std::filesystem;

// Every path in the forest, in display order.
static std::vector<std::string> visiblePaths(const Forest& forest) {
    std::vector<std::string> paths;
    for (const Row& row : flattenForest(forest)) {
        paths.push_back(row.node->path);
    }
    return paths;
}

class TreeBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string("treenav_test_builder_") + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "beta" / "inner");
        fs::create_directories(root_ / "Alpha");
        fs::create_directories(root_ / ".hidden_dir");
        std::ofstream(root_ / "zeta.txt") << "z";
        std::ofstream(root_ / "Gamma.md") << "g";
        std::ofstream(root_ / ".secret") << "s";
        std::ofstream(root_ / "beta" / "b.txt") << "b";
        std::ofstream(root_ / "beta" / ".dotfile") << "d";
        root_ = fs::canonical(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(root_ / "beta", fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root_, ec);
    }

    std::string path(const std::string& rel) const { return (root_ / rel).string(); }

    static std::vector<std::string> names(const Forest& forest) {
        std::vector<std::string> out;
        for (const auto& node : forest) {
            out.push_back(node->name);
        }
        return out;
    }

    fs::path root_;
    PersistentState state_;
    SizeCache sizes_;
    TreeBuilder builder_;
};

TEST_F(TreeBuilderTest, DirectoriesFirstCaseInsensitive) {
    Forest forest = builder_.build(root_.string(), state_, sizes_);
    std::vector<std::string> expected = {"Alpha", "beta", "Gamma.md", "zeta.txt"};
    EXPECT_EQ(names(forest), expected);

    EXPECT_EQ(forest[0]->type, NODE_DIRECTORY);
    EXPECT_EQ(forest[1]->type, NODE_DIRECTORY);
    EXPECT_EQ(forest[2]->type, NODE_FILE);
    EXPECT_EQ(forest[0]->path, path("Alpha"));
}

TEST_F(TreeBuilderTest, HiddenEntriesFilteredAtEveryLevel) {
    state_.setExpanded(path("beta"), true);
    Forest forest = builder_.build(root_.string(), state_, sizes_);
    for (const auto& p : visiblePaths(forest)) {
        EXPECT_EQ(p.find("/."), std::string::npos) << p;
    }

    state_.showHidden = true;
    forest = builder_.build(root_.string(), state_, sizes_);
    std::vector<std::string> paths = visiblePaths(forest);
    EXPECT_NE(std::find(paths.begin(), paths.end(), path(".hidden_dir")), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), path(".secret")), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), path("beta/.dotfile")), paths.end());
}

TEST_F(TreeBuilderTest, CollapsedDirectoriesAreNeverRead) {
    std::vector<std::string> reads;
    builder_.setReadCallback([&](const std::string& dir) { reads.push_back(dir); });

    Forest forest = builder_.build(root_.string(), state_, sizes_);
    ASSERT_EQ(reads.size(), 1u);
    EXPECT_EQ(reads[0], root_.string());

    // A collapsed directory has no children and is marked unexpanded
    const DisplayNode* beta = forest[1].get();
    EXPECT_EQ(beta->name, "beta");
    EXPECT_EQ(beta->type, NODE_DIRECTORY);
    EXPECT_EQ(beta->childCount(), 0u);
}

TEST_F(TreeBuilderTest, ExpandedDirectoriesAreRead) {
    std::vector<std::string> reads;
    builder_.setReadCallback([&](const std::string& dir) { reads.push_back(dir); });
    state_.setExpanded(path("beta"), true);

    Forest forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(reads.size(), 2u);

    const DisplayNode* beta = forest[1].get();
    ASSERT_EQ(beta->type, NODE_EXPANDED_DIR);
    ASSERT_EQ(beta->childCount(), 2u);
    EXPECT_EQ(beta->children[0]->name, "inner");
    EXPECT_EQ(beta->children[0]->type, NODE_DIRECTORY);
    EXPECT_EQ(beta->children[1]->name, "b.txt");
    EXPECT_EQ(beta->children[0]->parent, beta);
}

TEST_F(TreeBuilderTest, EmptyExpandedDirectoryIsStillExpanded) {
    state_.setExpanded(path("Alpha"), true);
    Forest forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(forest[0]->type, NODE_EXPANDED_DIR);
    EXPECT_EQ(forest[0]->childCount(), 0u);
}

TEST_F(TreeBuilderTest, DeletedExpandedDirectoryDisappears) {
    state_.setExpanded(path("beta"), true);
    fs::remove_all(root_ / "beta");

    Forest forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(names(forest), (std::vector<std::string>{"Alpha", "Gamma.md", "zeta.txt"}));
    EXPECT_TRUE(state_.isExpanded(path("beta")));
}

TEST_F(TreeBuilderTest, UnreadableDirectoryBecomesErrorLeaf) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    state_.setExpanded(path("beta"), true);
    fs::permissions(root_ / "beta", fs::perms::owner_all, fs::perm_options::remove);

    Forest forest = builder_.build(root_.string(), state_, sizes_);
    ASSERT_EQ(forest.size(), 4u);
    const DisplayNode* beta = forest[1].get();
    EXPECT_EQ(beta->type, NODE_ERROR_DIR);
    EXPECT_EQ(beta->error, READ_PERMISSION_DENIED);
    EXPECT_EQ(beta->childCount(), 0u);
    EXPECT_NE(beta->label.find("[Permission denied]"), std::string::npos);

    // Siblings are unaffected
    EXPECT_EQ(forest[0]->name, "Alpha");
    EXPECT_EQ(forest[3]->name, "zeta.txt");
}

TEST_F(TreeBuilderTest, MissingRootYieldsSingleErrorNode) {
    std::string missing = path("does_not_exist");
    Forest forest = builder_.build(missing, state_, sizes_);
    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0]->type, NODE_ERROR_DIR);
    EXPECT_EQ(forest[0]->error, READ_NOT_FOUND);
    EXPECT_EQ(forest[0]->path, missing);
    EXPECT_NE(forest[0]->label.find("[Not found]"), std::string::npos);
}

TEST_F(TreeBuilderTest, LabelsCarryStarAndSize) {
    std::string beta = path("beta");
    state_.setExpanded(beta, true);
    state_.setStarred(beta, true);

    Forest forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(forest[1]->label, std::string(Icons::dirIcon(true)) + " beta \xe2\x98\x85");
    EXPECT_TRUE(forest[1]->starred);

    sizes_.markPending(beta);
    forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(forest[1]->label, std::string(Icons::dirIcon(true)) + " beta \xe2\x98\x85 [...]");

    sizes_.resolve(beta, 1536);
    forest = builder_.build(root_.string(), state_, sizes_);
    EXPECT_EQ(forest[1]->label, std::string(Icons::dirIcon(true)) + " beta \xe2\x98\x85 [1.5K]");

    // Files never show a size
    EXPECT_EQ(forest.back()->label, std::string(Icons::fileIcon("zeta.txt")) + " zeta.txt");
}

TEST_F(TreeBuilderTest, CollapsedDirectoryHidesSize) {
    std::string alpha = path("Alpha");
    sizes_.markPending(alpha);
    sizes_.resolve(alpha, 10);
    EXPECT_EQ(TreeBuilder::formatLabel(alpha, true, false, false, &sizes_),
              std::string(Icons::dirIcon(false)) + " Alpha");
}

TEST_F(TreeBuilderTest, StarredListSortedAndFiltered) {
    std::set<std::string> starred = {path("beta"), path("Alpha"), path("gone")};
    Forest forest = builder_.buildStarredList(starred);

    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0]->path, path("Alpha"));
    EXPECT_EQ(forest[1]->path, path("beta"));
    EXPECT_EQ(forest[0]->label, "\xe2\x98\x85 " + path("Alpha"));
    EXPECT_TRUE(forest[0]->starred);
    EXPECT_TRUE(forest[0]->isDir());
}

TEST_F(TreeBuilderTest, BookmarksListLabels) {
    PersistentState state;
    state.addBookmark(path("beta"), "work");
    state.addBookmark(path("Alpha"), "");
    state.addBookmark(path("gone"), "stale");

    Forest forest = builder_.buildBookmarksList(state.bookmarks);
    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0]->label, "\xf0\x9f\x93\x8c work (beta)");
    EXPECT_EQ(forest[1]->label, "\xf0\x9f\x93\x8c " + path("Alpha"));
}

TEST_F(TreeBuilderTest, RecentListKeepsOrder) {
    std::deque<std::string> recent = {path("beta"), path("gone"), path("Alpha")};
    Forest forest = builder_.buildRecentList(recent);

    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0]->path, path("beta"));
    EXPECT_EQ(forest[1]->path, path("Alpha"));
    EXPECT_EQ(forest[0]->label, "\xe2\x8f\xb1 " + path("beta"));
}

TEST_F(TreeBuilderTest, SearchResultsTouchNoFiles) {
    std::vector<std::string> reads;
    builder_.setReadCallback([&](const std::string& dir) { reads.push_back(dir); });

    std::vector<SearchMatch> matches = {
        {"/nowhere/config.rs", 15, false},
        {"/nowhere/src", 10, true},
    };
    Forest forest = builder_.buildSearchResults(matches);

    EXPECT_TRUE(reads.empty());
    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0]->path, "/nowhere/config.rs");
    EXPECT_EQ(forest[0]->type, NODE_FILE);
    EXPECT_EQ(forest[0]->label, std::string(Icons::fileIcon("config.rs")) + " config.rs");
    EXPECT_EQ(forest[1]->type, NODE_DIRECTORY);
    EXPECT_EQ(forest[1]->label, std::string(Icons::dirIcon(false)) + " src");
}

TEST(TreeBuilderErrorTest, ClassifyError) {
    EXPECT_EQ(TreeBuilder::classifyError(std::make_error_code(std::errc::permission_denied)),
              READ_PERMISSION_DENIED);
    EXPECT_EQ(TreeBuilder::classifyError(std::make_error_code(std::errc::no_such_file_or_directory)),
              READ_NOT_FOUND);
    EXPECT_EQ(TreeBuilder::classifyError(std::make_error_code(std::errc::io_error)), READ_OTHER);
}
