#include "nav/Controller.h"
#include "core/PlatformUtils.h"
#include "size/SizeWorker.h"
#include "state/PersistentState.h"

#include <algorithm>
#include <filesystem>

namespace treenav {

Controller::Controller(std::string rootPath, PersistentState& state, SizeWorker& sizeWorker)
    : rootPath_(std::move(rootPath)), state_(state), sizeWorker_(sizeWorker),
      forest_(std::make_shared<const Forest>()) {
    rebuild();
    selectFirst();
}

// ============================================================================
// Forest and cursor bookkeeping
// ============================================================================
void Controller::setForest(std::shared_ptr<const Forest> forest) {
    // rows_ points into forest_, so both are replaced together.
    forest_ = std::move(forest);
    rows_ = flattenForest(*forest_);
    if (cursor_ >= static_cast<int>(rows_.size())) {
        cursor_ = static_cast<int>(rows_.size()) - 1;
    }
}

void Controller::rebuild() {
    std::string prevPath = cursorPath();
    int prevIndex = cursor_;

    Forest forest;
    switch (viewMode_) {
        case VIEW_TREE:
            forest = builder_.build(rootPath_, state_, sizes_);
            break;
        case VIEW_STARRED:
            forest = builder_.buildStarredList(state_.starredDirs);
            break;
        case VIEW_BOOKMARKS:
            forest = builder_.buildBookmarksList(state_.bookmarks);
            break;
        case VIEW_RECENT:
            forest = builder_.buildRecentList(state_.recentDirs);
            break;
    }

    setForest(std::make_shared<const Forest>(std::move(forest)));
    if (viewMode_ == VIEW_TREE) {
        forestStale_ = false;
    }
    restoreCursor(prevPath, prevIndex);
}

void Controller::restoreCursor(const std::string& path, int fallbackIndex) {
    if (rows_.empty()) {
        cursor_ = -1;
        return;
    }

    if (!path.empty()) {
        int row = findRow(rows_, path);
        if (row >= 0) {
            cursor_ = row;
            return;
        }

        // The row vanished (collapsed parent, hidden file, deleted entry).
        std::filesystem::path current(path);
        while (current.has_parent_path() && current.parent_path() != current) {
            current = current.parent_path();
            row = findRow(rows_, current.string());
            if (row >= 0) {
                cursor_ = row;
                return;
            }
        }
    }

    int last = static_cast<int>(rows_.size()) - 1;
    cursor_ = std::clamp(fallbackIndex, 0, last);
}

const DisplayNode* Controller::selectedNode() const {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(rows_.size())) {
        return nullptr;
    }
    return rows_[cursor_].node;
}

std::string Controller::cursorPath() const {
    const DisplayNode* node = selectedNode();
    return node ? node->path : std::string();
}

// ============================================================================
// Cursor movement
// ============================================================================
void Controller::moveCursor(int delta) {
    if (rows_.empty()) {
        cursor_ = -1;
        return;
    }
    int last = static_cast<int>(rows_.size()) - 1;
    int from = cursor_ < 0 ? 0 : cursor_;
    cursor_ = std::clamp(from + delta, 0, last);
}

void Controller::selectRow(int index) {
    if (index >= 0 && index < static_cast<int>(rows_.size())) {
        cursor_ = index;
    }
}

void Controller::selectFirst() {
    cursor_ = rows_.empty() ? -1 : 0;
}

void Controller::selectLast() {
    cursor_ = static_cast<int>(rows_.size()) - 1;
}

// ============================================================================
// Size requests
// ============================================================================
bool Controller::requestSize(const std::string& path) {
    if (sizes_.contains(path)) {
        return false;
    }
    // A dropped request leaves no entry, so a later expand asks again.
    if (!sizeWorker_.request(path)) {
        return false;
    }
    sizes_.markPending(path);
    return true;
}

void Controller::tick() {
    size_t arrived = sizeWorker_.pollResults(sizes_);
    if (arrived == 0) {
        return;
    }

    // Labels only carry sizes in the Tree view. During search the visible
    // forest is the result list, so the refresh waits until search ends.
    if (viewMode_ == VIEW_TREE) {
        if (inputMode_ == INPUT_SEARCH) {
            forestStale_ = true;
        } else {
            rebuild();
        }
    } else {
        forestStale_ = true;
    }
}

// ============================================================================
// Tree operations
// ============================================================================
void Controller::expandSelected() {
    if (viewMode_ != VIEW_TREE) return;
    const DisplayNode* node = selectedNode();
    if (!node || !node->isDir() || state_.isExpanded(node->path)) return;

    std::string path = node->path;
    state_.setExpanded(path, true);
    requestSize(path);
    rebuild();
}

void Controller::collapseOrParent() {
    if (viewMode_ != VIEW_TREE) return;
    const DisplayNode* node = selectedNode();
    if (!node) return;

    if (node->isDir() && state_.isExpanded(node->path)) {
        state_.setExpanded(node->path, false);
        rebuild();
        return;
    }

    if (node->parent) {
        int row = findRow(rows_, node->parent->path);
        if (row >= 0) {
            cursor_ = row;
        }
    }
}

void Controller::toggleSelected() {
    if (viewMode_ != VIEW_TREE) return;
    const DisplayNode* node = selectedNode();
    if (!node || !node->isDir()) return;

    std::string path = node->path;
    if (state_.isExpanded(path)) {
        state_.setExpanded(path, false);
    } else {
        state_.setExpanded(path, true);
        requestSize(path);
    }
    rebuild();
}

// ============================================================================
// State operations
// ============================================================================
void Controller::toggleStar() {
    const DisplayNode* node = selectedNode();
    if (!node || !node->isDir()) return;

    state_.toggleStarred(node->path);
    rebuild();
}

void Controller::toggleHidden() {
    state_.showHidden = !state_.showHidden;
    rebuild();
}

void Controller::selectAndQuit() {
    const DisplayNode* node = selectedNode();
    if (!node || !node->isDir()) return;

    state_.addRecent(node->path);
    chosenDir_ = node->path;
    shouldQuit_ = true;
}

void Controller::toggleView(ViewMode mode) {
    if (mode == VIEW_TREE || inputMode_ != INPUT_NORMAL) return;

    if (viewMode_ == mode) {
        returnToTree();
        return;
    }

    // Switching between two alternate views keeps the Tree snapshot taken on leaving Tree.
    if (viewMode_ == VIEW_TREE) {
        treeSnapshot_ = ViewSnapshot{forest_, cursorPath()};
    }
    viewMode_ = mode;
    rebuild();
    selectFirst();
}

void Controller::returnToTree() {
    viewMode_ = VIEW_TREE;
    if (treeSnapshot_) {
        ViewSnapshot snapshot = std::move(*treeSnapshot_);
        treeSnapshot_.reset();
        setForest(snapshot.forest);
        restoreCursor(snapshot.cursorPath, 0);
    } else {
        selectFirst();
    }
    // Stars, expansions and sizes may have changed meanwhile.
    rebuild();
}

// ============================================================================
// Search
// ============================================================================
void Controller::enterSearch() {
    if (inputMode_ != INPUT_NORMAL) return;

    inputMode_ = INPUT_SEARCH;
    resetSearchState();
    searchSnapshot_ = ViewSnapshot{forest_, cursorPath()};
    searchIndex_.snapshot(*forest_);
}

void Controller::setSearchQuery(const std::string& query) {
    if (inputMode_ != INPUT_SEARCH) return;
    searchInput_.setText(query);
    updateSearchMatches();
}

void Controller::updateSearchMatches() {
    std::string query = searchInput_.text();
    matchIndex_ = 0;

    if (query.empty()) {
        searchMatches_.clear();
        setForest(searchSnapshot_->forest);
        selectFirst();
        return;
    }

    searchMatches_ = searchIndex_.query(query);
    setForest(std::make_shared<const Forest>(builder_.buildSearchResults(searchMatches_)));
    selectFirst();
}

void Controller::selectSearchMatch() {
    if (searchMatches_.empty()) return;
    int row = findRow(rows_, searchMatches_[matchIndex_].path);
    if (row >= 0) {
        cursor_ = row;
    }
}

void Controller::nextMatch() {
    if (searchMatches_.empty()) return;
    matchIndex_ = (matchIndex_ + 1) % searchMatches_.size();
    selectSearchMatch();
}

void Controller::prevMatch() {
    if (searchMatches_.empty()) return;
    matchIndex_ = matchIndex_ == 0 ? searchMatches_.size() - 1 : matchIndex_ - 1;
    selectSearchMatch();
}

void Controller::resetSearchState() {
    searchInput_.clear();
    searchMatches_.clear();
    matchIndex_ = 0;
    searchIndex_.clear();
}

void Controller::cancelSearch() {
    if (inputMode_ != INPUT_SEARCH) return;

    inputMode_ = INPUT_NORMAL;
    resetSearchState();
    if (searchSnapshot_) {
        ViewSnapshot snapshot = std::move(*searchSnapshot_);
        searchSnapshot_.reset();
        setForest(snapshot.forest);
        restoreCursor(snapshot.cursorPath, 0);
    }

    if (forestStale_ && viewMode_ == VIEW_TREE) {
        rebuild();
    }
}

void Controller::confirmSearch() {
    if (inputMode_ != INPUT_SEARCH) return;
    if (searchMatches_.empty()) {
        cancelSearch();
        return;
    }

    std::string target = searchMatches_[matchIndex_].path;
    inputMode_ = INPUT_NORMAL;
    resetSearchState();
    searchSnapshot_.reset();

    // A jump always lands in the full tree.
    treeSnapshot_.reset();
    viewMode_ = VIEW_TREE;

    std::vector<std::string> chain = SearchIndex::ancestorChain(rootPath_, target);
    if (!chain.empty()) {
        chain.pop_back();   // the target itself stays as it was
    }
    for (const auto& dir : chain) {
        if (!state_.isExpanded(dir)) {
            state_.setExpanded(dir, true);
            requestSize(dir);
        }
    }

    rebuild();
    int row = findRow(rows_, target);
    if (row >= 0) {
        cursor_ = row;
    } else {
        selectFirst();
    }
}

// ============================================================================
// Bookmark label
// ============================================================================
void Controller::beginBookmark() {
    if (inputMode_ != INPUT_NORMAL) return;
    const DisplayNode* node = selectedNode();
    if (!node || !node->isDir()) return;

    bookmarkPath_ = node->path;
    const Bookmark* existing = state_.findBookmark(bookmarkPath_);
    bookmarkInput_.setText(existing ? existing->label : std::string());
    inputMode_ = INPUT_BOOKMARK_LABEL;
}

void Controller::confirmBookmark() {
    if (inputMode_ != INPUT_BOOKMARK_LABEL) return;

    state_.addBookmark(bookmarkPath_, bookmarkInput_.text());
    cancelBookmark();
    rebuild();
}

void Controller::cancelBookmark() {
    inputMode_ = INPUT_NORMAL;
    bookmarkInput_.clear();
    bookmarkPath_.clear();
}

// ============================================================================
// Key dispatch
// ============================================================================
void Controller::handleKey(const KeyEvent& key) {
    if (showHelp_) {
        showHelp_ = false;
        return;
    }

    switch (inputMode_) {
        case INPUT_NORMAL:
            handleNormalKey(key);
            break;
        case INPUT_SEARCH:
            handleSearchKey(key);
            break;
        case INPUT_BOOKMARK_LABEL:
            handleBookmarkKey(key);
            break;
    }
}

void Controller::handleNormalKey(const KeyEvent& key) {
    if (key.ctrl) {
        switch (key.ch) {
            case U'c': quit(); break;
            case U'u': halfPageUp(); break;
            case U'd': halfPageDown(); break;
            default: break;
        }
        return;
    }

    switch (key.code) {
        case KeyCode::Escape:   quit(); return;
        case KeyCode::Enter:    selectAndQuit(); return;
        case KeyCode::Up:       moveCursor(-1); return;
        case KeyCode::Down:     moveCursor(1); return;
        case KeyCode::Left:     collapseOrParent(); return;
        case KeyCode::Right:    expandSelected(); return;
        case KeyCode::Home:     selectFirst(); return;
        case KeyCode::End:      selectLast(); return;
        case KeyCode::PageUp:   pageUp(); return;
        case KeyCode::PageDown: pageDown(); return;
        case KeyCode::Char:     break;
        default: return;
    }

    switch (key.ch) {
        case U'q': quit(); break;
        case U'?': toggleHelp(); break;
        case U'/': enterSearch(); break;
        case U'k': moveCursor(-1); break;
        case U'j': moveCursor(1); break;
        case U'h': collapseOrParent(); break;
        case U'l': expandSelected(); break;
        case U' ': toggleSelected(); break;
        case U'g': selectFirst(); break;
        case U'G': selectLast(); break;
        case U's': toggleStar(); break;
        case U'S': toggleView(VIEW_STARRED); break;
        case U'b': beginBookmark(); break;
        case U'B': toggleView(VIEW_BOOKMARKS); break;
        case U'r': toggleView(VIEW_RECENT); break;
        case U'.': toggleHidden(); break;
        case U'p': togglePreview(); break;
        default: break;
    }
}

void Controller::handleSearchKey(const KeyEvent& key) {
    if (key.ctrl) {
        if (key.ch == U'c') {
            cancelSearch();
        }
        return;
    }

    switch (key.code) {
        case KeyCode::Escape:  cancelSearch(); return;
        case KeyCode::Enter:   confirmSearch(); return;
        case KeyCode::Down:
        case KeyCode::Tab:     nextMatch(); return;
        case KeyCode::Up:
        case KeyCode::BackTab: prevMatch(); return;
        default: break;
    }

    if (applyEdit(searchInput_, key)) {
        updateSearchMatches();
    }
}

void Controller::handleBookmarkKey(const KeyEvent& key) {
    if (key.ctrl) {
        if (key.ch == U'c') {
            cancelBookmark();
        }
        return;
    }

    switch (key.code) {
        case KeyCode::Escape: cancelBookmark(); return;
        case KeyCode::Enter:  confirmBookmark(); return;
        default: break;
    }

    applyEdit(bookmarkInput_, key);
}

bool Controller::applyEdit(LineEdit& edit, const KeyEvent& key) {
    std::string before = edit.text();
    switch (key.code) {
        case KeyCode::Char:
            if (key.ch >= 0x20 && key.ch != 0x7f) {
                edit.insert(key.ch);
            }
            break;
        case KeyCode::Backspace: edit.backspace(); break;
        case KeyCode::Delete:    edit.deleteForward(); break;
        case KeyCode::Left:      edit.moveLeft(); break;
        case KeyCode::Right:     edit.moveRight(); break;
        case KeyCode::Home:      edit.moveHome(); break;
        case KeyCode::End:       edit.moveEnd(); break;
        default: break;
    }
    return edit.text() != before;
}

// ============================================================================
// Mouse
// ============================================================================
void Controller::handleMouse(const MouseEvent& mouse) {
    if (showHelp_) {
        showHelp_ = false;
        return;
    }
    if (inputMode_ == INPUT_BOOKMARK_LABEL) return;

    switch (mouse.action) {
        case MouseAction::ScrollUp:
            moveCursor(-SCROLL_LINES);
            break;
        case MouseAction::ScrollDown:
            moveCursor(SCROLL_LINES);
            break;
        case MouseAction::LeftClick: {
            if (mouse.row < 0 || mouse.row >= static_cast<int>(rows_.size())) {
                break;
            }
            bool doubleClick = mouse.row == lastClickRow_ &&
                               lastClickTime_ >= 0.0 &&
                               mouse.time - lastClickTime_ < DOUBLE_CLICK_SECONDS;
            selectRow(mouse.row);
            if (doubleClick && inputMode_ == INPUT_NORMAL) {
                toggleSelected();
            }

            // A double click consumes the pair; a third click starts over.
            lastClickRow_ = doubleClick ? -1 : mouse.row;
            lastClickTime_ = doubleClick ? -1.0 : mouse.time;
            break;
        }
    }

    // Keep the highlighted match in step with the row under the cursor.
    if (inputMode_ == INPUT_SEARCH && !searchMatches_.empty() && cursor_ >= 0) {
        matchIndex_ = static_cast<size_t>(cursor_);
    }
}

} // namespace treenav
