#include "ui/TreePanel.h"
#include "nav/Controller.h"
#include "state/PersistentState.h"
#include "ui/Screen.h"

#include <algorithm>

namespace treenav {

static constexpr const char* SELECTED_MARK = "\xe2\x96\xb8 ";   // "▸ "
static constexpr const char* OPEN_MARK     = "\xe2\x96\xbc ";   // "▼ "
static constexpr const char* CLOSED_MARK   = "\xe2\x96\xb6 ";   // "▶ "

TreePanel& TreePanel::instance() {
    static TreePanel s;
    return s;
}

// ============================================================================
// Layout
// ============================================================================
void TreePanel::draw(Controller& controller) {
    Screen& screen = Screen::instance();

    // Everything above the footer line
    top_ = 0;
    left_ = 0;
    height_ = std::max(screen.lines() - 1, 0);
    width_ = screen.cols();

    if (controller.showPreview()) {
        width_ = screen.cols() / 2;
        previewLeft_ = width_;
        previewWidth_ = screen.cols() - width_;
    } else {
        previewWidth_ = 0;
    }

    controller.setVisibleHeight(height_ - 2);
    scrollToCursor(controller);
    drawTree(controller);

    if (previewWidth_ > 0) {
        drawPreview(controller);
    }
}

void TreePanel::scrollToCursor(const Controller& controller) {
    int visible = std::max(height_ - 2, 1);
    rowCount_ = static_cast<int>(controller.rows().size());
    int cursor = controller.cursorIndex();

    if (cursor >= 0) {
        if (cursor < scrollTop_) {
            scrollTop_ = cursor;
        } else if (cursor >= scrollTop_ + visible) {
            scrollTop_ = cursor - visible + 1;
        }
    }
    scrollTop_ = std::clamp(scrollTop_, 0, std::max(rowCount_ - visible, 0));
}

int TreePanel::rowAt(int y, int x) const {
    if (x <= left_ || x >= left_ + width_ - 1) return -1;
    if (y <= top_ || y >= top_ + height_ - 1) return -1;

    int row = scrollTop_ + (y - top_ - 1);
    return row < rowCount_ ? row : -1;
}

// ============================================================================
// Tree list
// ============================================================================
void TreePanel::drawTree(const Controller& controller) {
    Screen& screen = Screen::instance();
    bool altView = controller.viewMode() != VIEW_TREE;

    std::string title = altView
        ? std::string(" ") + viewModeTitles[controller.viewMode()] + " "
        : " " + controller.rootPath() + " ";
    chtype frameAttr = screen.attr(altView ? PAIR_STARRED : PAIR_BORDER);
    screen.drawBox(top_, left_, height_, width_, frameAttr, title, frameAttr | A_BOLD);

    // Disclosure marks only make sense while the tree itself is shown.
    bool showingTree = !altView &&
        (controller.inputMode() != INPUT_SEARCH || controller.searchInput().empty());

    const auto& rows = controller.rows();
    int innerWidth = width_ - 2;
    int visible = height_ - 2;

    for (int i = 0; i < visible; ++i) {
        int index = scrollTop_ + i;
        if (index >= static_cast<int>(rows.size())) break;

        const Row& row = rows[index];
        const DisplayNode* node = row.node;
        bool selected = index == controller.cursorIndex();
        int y = top_ + 1 + i;
        int x = left_ + 1;

        chtype textAttr;
        if (selected) {
            textAttr = screen.attr(PAIR_HIGHLIGHT) | A_BOLD;
            screen.fill(y, x, innerWidth, textAttr);
        } else if (node->isError()) {
            textAttr = screen.attr(PAIR_DIM);
        } else if (node->starred) {
            textAttr = screen.attr(PAIR_STARRED);
        } else {
            textAttr = screen.attr(PAIR_TEXT);
        }

        std::string line = selected ? SELECTED_MARK : "  ";
        line.append(static_cast<size_t>(row.depth) * 2, ' ');
        if (showingTree && node->isDir()) {
            line += node->isExpanded() ? OPEN_MARK : CLOSED_MARK;
        } else if (showingTree) {
            line += "  ";
        }
        line += node->label;

        screen.print(y, x, line, innerWidth, textAttr);
    }
}

// ============================================================================
// Preview pane
// ============================================================================
void TreePanel::drawPreview(const Controller& controller) {
    Screen& screen = Screen::instance();

    std::string path = controller.cursorPath();
    bool showHidden = controller.state().showHidden;
    if (!previewValid_ || path != previewPath_ || showHidden != previewHidden_) {
        preview_ = Preview::build(path, showHidden);
        for (auto& line : preview_.lines) {
            // curses would expand tabs past the pane edge
            std::replace(line.begin(), line.end(), '\t', ' ');
        }
        previewPath_ = path;
        previewHidden_ = showHidden;
        previewValid_ = true;
    }

    chtype frameAttr = screen.attr(PAIR_BORDER);
    screen.drawBox(top_, previewLeft_, height_, previewWidth_, frameAttr,
                   " " + preview_.title + " ", frameAttr | A_BOLD);

    int visible = height_ - 2;
    int count = std::min(visible, static_cast<int>(preview_.lines.size()));
    for (int i = 0; i < count; ++i) {
        screen.print(top_ + 1 + i, previewLeft_ + 1, preview_.lines[i],
                     previewWidth_ - 2, screen.attr(PAIR_DIM));
    }
}

} // namespace treenav
