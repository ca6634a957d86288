#include "ui/StatusBar.h"
#include "core/PlatformUtils.h"
#include "nav/Controller.h"
#include "state/PersistentState.h"
#include "ui/Screen.h"

#include <utility>
#include <vector>

namespace treenav {

using Hint = std::pair<const char*, const char*>;

static const std::vector<Hint> treeHints = {
    {"\xe2\x86\x91\xe2\x86\x93/jk", "nav"},       // ↑↓
    {"\xe2\x86\x90\xe2\x86\x92/hl", "tree"},      // ←→
    {"Space", "toggle"},
    {"Enter", "cd"},
    {"s", "star"},
    {"b", "mark"},
    {"/", "search"},
    {"p", "preview"},
    {".", "hidden"},
    {"B", "marks"},
    {"r", "recent"},
    {"?", "help"},
    {"q", "quit"},
};

static const std::vector<Hint> starredHints = {
    {"\xe2\x86\x91\xe2\x86\x93/jk", "navigate"},
    {"Enter", "cd"},
    {"s", "unstar"},
    {"S", "back"},
    {"?", "help"},
    {"q", "quit"},
};

static const std::vector<Hint> bookmarkHints = {
    {"\xe2\x86\x91\xe2\x86\x93/jk", "navigate"},
    {"Enter", "cd"},
    {"B", "back"},
    {"?", "help"},
    {"q", "quit"},
};

static const std::vector<Hint> recentHints = {
    {"\xe2\x86\x91\xe2\x86\x93/jk", "navigate"},
    {"Enter", "cd"},
    {"r", "back"},
    {"?", "help"},
    {"q", "quit"},
};

StatusBar& StatusBar::instance() {
    static StatusBar s;
    return s;
}

void StatusBar::draw(const Controller& controller) {
    Screen& screen = Screen::instance();
    int y = screen.lines() - 1;
    if (y < 0) return;

    screen.fill(y, 0, screen.cols(), screen.attr(PAIR_BAR_TEXT));
    if (controller.inputMode() == INPUT_SEARCH) {
        drawSearch(controller, y);
    } else {
        drawHints(controller, y);
    }
}

void StatusBar::drawHints(const Controller& controller, int y) {
    Screen& screen = Screen::instance();

    std::vector<Hint> hints;
    switch (controller.viewMode()) {
        case VIEW_TREE:      hints = treeHints; break;
        case VIEW_STARRED:   hints = starredHints; break;
        case VIEW_BOOKMARKS: hints = bookmarkHints; break;
        case VIEW_RECENT:    hints = recentHints; break;
    }
    if (controller.state().showHidden && controller.viewMode() == VIEW_TREE) {
        hints.insert(hints.begin(), Hint{"\xe2\x97\x8f", "hidden"});   // ●
    }

    int x = 0;
    int cols = screen.cols();
    for (size_t i = 0; i < hints.size() && x < cols; ++i) {
        x += screen.print(y, x, hints[i].first, cols - x, screen.attr(PAIR_BAR_KEY) | A_BOLD);
        x += screen.print(y, x, std::string(" ") + hints[i].second + " ", cols - x,
                          screen.attr(PAIR_BAR_DIM));
        if (i + 1 < hints.size()) {
            x += screen.print(y, x, "\xe2\x94\x82 ", cols - x, screen.attr(PAIR_BAR_DIM));   // "│ "
        }
    }
}

void StatusBar::drawSearch(const Controller& controller, int y) {
    Screen& screen = Screen::instance();
    const LineEdit& input = controller.searchInput();
    int cols = screen.cols();

    std::string count;
    if (!input.empty()) {
        const auto& matches = controller.searchMatches();
        if (matches.empty()) {
            count = " [no match]";
        } else {
            count = " [" + std::to_string(controller.matchIndex() + 1) + "/" +
                    std::to_string(matches.size()) + "]";
        }
    }

    int x = screen.print(y, 0, "/" + input.text(), cols, screen.attr(PAIR_BAR_TEXT));
    screen.print(y, x, count, cols - x, screen.attr(PAIR_BAR_DIM));

    int cursorX = 1 + PlatformUtils::displayWidth(input.textBeforeCursor());
    if (cursorX < cols) {
        screen.placeCursor(y, cursorX);
    }
}

} // namespace treenav
