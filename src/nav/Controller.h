#pragma once

#include "core/DisplayNode.h"
#include "core/TreeBuilder.h"
#include "core/Types.h"
#include "nav/InputEvent.h"
#include "nav/LineEdit.h"
#include "search/SearchIndex.h"
#include "size/SizeCache.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace treenav {

class PersistentState;
class SizeWorker;

// A forest together with the cursor that was on it.
struct ViewSnapshot {
    std::shared_ptr<const Forest> forest;
    std::string cursorPath;
};

// ============================================================================
// Controller - navigation state machine
//
// View modes (Tree, Starred, Bookmarks, Recent) and input modes (Normal,
// Search, BookmarkLabel) are independent axes. Each non-default mode owns
// the snapshot taken when it was entered, so a snapshot exists exactly while
// its mode is active.
//
// Every state mutation rebuilds the active view from PersistentState and the
// SizeCache; nodes are never patched in place.
// ============================================================================

class Controller {
public:
    Controller(std::string rootPath, PersistentState& state, SizeWorker& sizeWorker);

    // --- Input ---

    void handleKey(const KeyEvent& key);
    void handleMouse(const MouseEvent& mouse);

    // Drain finished size computations. Called once per loop iteration.
    void tick();

    // --- Cursor movement ---

    void moveCursor(int delta);
    void selectRow(int index);
    void selectFirst();
    void selectLast();
    void pageUp() { moveCursor(-visibleHeight_); }
    void pageDown() { moveCursor(visibleHeight_); }
    void halfPageUp() { moveCursor(-(visibleHeight_ / 2)); }
    void halfPageDown() { moveCursor(visibleHeight_ / 2); }

    // --- Tree operations (Tree view only) ---

    void expandSelected();
    void collapseOrParent();
    void toggleSelected();

    // --- State operations ---

    void toggleStar();
    void toggleHidden();
    void selectAndQuit();
    void quit() { shouldQuit_ = true; }

    // Enter `mode`, or return to Tree when `mode` is already active.
    void toggleView(ViewMode mode);

    // --- Search ---

    void enterSearch();
    void setSearchQuery(const std::string& query);
    void nextMatch();
    void prevMatch();
    void cancelSearch();
    void confirmSearch();

    // --- Bookmark label ---

    void beginBookmark();
    void setBookmarkLabel(const std::string& label) { bookmarkInput_.setText(label); }
    void confirmBookmark();
    void cancelBookmark();

    // --- Overlays ---

    void toggleHelp() { showHelp_ = !showHelp_; }
    void togglePreview() { showPreview_ = !showPreview_; }

    // Queue a size computation unless the path already has a cache entry.
    // Returns true when a request was enqueued.
    bool requestSize(const std::string& path);

    // --- Accessors ---

    const std::string& rootPath() const { return rootPath_; }
    const PersistentState& state() const { return state_; }
    const SizeCache& sizes() const { return sizes_; }
    const Forest& forest() const { return *forest_; }
    const std::vector<Row>& rows() const { return rows_; }
    int cursorIndex() const { return cursor_; }
    const DisplayNode* selectedNode() const;
    std::string cursorPath() const;

    ViewMode viewMode() const { return viewMode_; }
    InputMode inputMode() const { return inputMode_; }
    bool hasTreeSnapshot() const { return treeSnapshot_.has_value(); }
    bool hasSearchSnapshot() const { return searchSnapshot_.has_value(); }

    const LineEdit& searchInput() const { return searchInput_; }
    const std::vector<SearchMatch>& searchMatches() const { return searchMatches_; }
    size_t matchIndex() const { return matchIndex_; }

    const LineEdit& bookmarkInput() const { return bookmarkInput_; }
    const std::string& bookmarkPath() const { return bookmarkPath_; }

    bool showHelp() const { return showHelp_; }
    bool showPreview() const { return showPreview_; }

    bool shouldQuit() const { return shouldQuit_; }
    const std::optional<std::string>& chosenDir() const { return chosenDir_; }

    int visibleHeight() const { return visibleHeight_; }
    void setVisibleHeight(int rows) { visibleHeight_ = rows > 1 ? rows : 1; }

    TreeBuilder& builder() { return builder_; }

private:
    void handleNormalKey(const KeyEvent& key);
    void handleSearchKey(const KeyEvent& key);
    void handleBookmarkKey(const KeyEvent& key);

    // Apply an editing key to a line buffer. Returns true if the text changed.
    static bool applyEdit(LineEdit& edit, const KeyEvent& key);

    // Rebuild the active view from current state, keeping the cursor on the
    // same path when it is still present.
    void rebuild();

    // Replace the forest and recompute rows. The cursor is left to the caller.
    void setForest(std::shared_ptr<const Forest> forest);

    // Put the cursor on `path`, else its nearest visible ancestor, else the
    // row closest to `fallbackIndex`.
    void restoreCursor(const std::string& path, int fallbackIndex);

    void returnToTree();
    void updateSearchMatches();
    void selectSearchMatch();
    void resetSearchState();

    std::string rootPath_;
    PersistentState& state_;
    SizeWorker& sizeWorker_;
    SizeCache sizes_;
    TreeBuilder builder_;
    SearchIndex searchIndex_;

    std::shared_ptr<const Forest> forest_;
    std::vector<Row> rows_;
    int cursor_ = -1;

    ViewMode viewMode_ = VIEW_TREE;
    InputMode inputMode_ = INPUT_NORMAL;
    std::optional<ViewSnapshot> treeSnapshot_;     // while viewMode_ != VIEW_TREE
    std::optional<ViewSnapshot> searchSnapshot_;   // while inputMode_ == INPUT_SEARCH

    LineEdit searchInput_;
    std::vector<SearchMatch> searchMatches_;
    size_t matchIndex_ = 0;

    LineEdit bookmarkInput_;
    std::string bookmarkPath_;

    // Sizes arrived while the Tree forest could not be rebuilt.
    bool forestStale_ = false;

    bool showHelp_ = false;
    bool showPreview_ = false;
    bool shouldQuit_ = false;
    std::optional<std::string> chosenDir_;

    int visibleHeight_ = 20;
    double lastClickTime_ = -1.0;
    int lastClickRow_ = -1;
};

} // namespace treenav
