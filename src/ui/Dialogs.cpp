#include "ui/Dialogs.h"
#include "core/PlatformUtils.h"
#include "nav/Controller.h"
#include "ui/Screen.h"

#include <algorithm>
#include <vector>

namespace treenav {

static constexpr int HELP_WIDTH = 60;
static constexpr int HELP_HEIGHT = 29;
static constexpr int BOOKMARK_WIDTH = 50;
static constexpr int BOOKMARK_HEIGHT = 5;
static constexpr int HELP_KEY_COLUMN = 14;

struct HelpLine {
    enum Kind { TITLE, SECTION, BINDING, BLANK, FOOTER } kind;
    const char* key;
    const char* text;
};

static const std::vector<HelpLine> helpLines = {
    {HelpLine::TITLE,   "treenav", " - Terminal Directory Navigator"},
    {HelpLine::BLANK,   "", ""},
    {HelpLine::SECTION, "NAVIGATION", ""},
    {HelpLine::BINDING, "\xe2\x86\x91 / k", "Move up"},
    {HelpLine::BINDING, "\xe2\x86\x93 / j", "Move down"},
    {HelpLine::BINDING, "\xe2\x86\x90 / h", "Collapse directory / go to parent"},
    {HelpLine::BINDING, "\xe2\x86\x92 / l", "Expand directory"},
    {HelpLine::BINDING, "Space", "Toggle expand/collapse"},
    {HelpLine::BINDING, "g / Home", "Go to first item"},
    {HelpLine::BINDING, "G / End", "Go to last item"},
    {HelpLine::BINDING, "PgUp/PgDn", "Page up/down"},
    {HelpLine::BINDING, "Ctrl+u/d", "Half page up/down"},
    {HelpLine::BLANK,   "", ""},
    {HelpLine::SECTION, "ACTIONS", ""},
    {HelpLine::BINDING, "Enter", "cd to selected directory and exit"},
    {HelpLine::BINDING, "s", "Toggle star on directory"},
    {HelpLine::BINDING, "S", "Switch to/from starred view"},
    {HelpLine::BINDING, "/", "Fuzzy search files and folders"},
    {HelpLine::BINDING, "p", "Toggle preview pane"},
    {HelpLine::BINDING, ".", "Toggle hidden files"},
    {HelpLine::BINDING, "b", "Add/edit bookmark with label"},
    {HelpLine::BINDING, "B", "Open/close bookmarks view"},
    {HelpLine::BINDING, "r", "Open/close recent directories"},
    {HelpLine::BINDING, "q / Ctrl+c", "Quit without changing directory"},
    {HelpLine::BINDING, "?", "Toggle this help"},
    {HelpLine::BLANK,   "", ""},
    {HelpLine::FOOTER,  "Press any key to close", ""},
};

Dialogs& Dialogs::instance() {
    static Dialogs s;
    return s;
}

void Dialogs::draw(const Controller& controller) {
    if (controller.showHelp()) {
        drawHelp();
    }
    if (controller.inputMode() == INPUT_BOOKMARK_LABEL) {
        drawBookmarkInput(controller);
    }
}

// ============================================================================
// Help overlay
// ============================================================================
void Dialogs::drawHelp() {
    Screen& screen = Screen::instance();

    int width = std::min(HELP_WIDTH, screen.cols() - 4);
    int height = std::min(HELP_HEIGHT, screen.lines() - 4);
    if (width < 4 || height < 3) return;
    int top = (screen.lines() - height) / 2;
    int left = (screen.cols() - width) / 2;

    chtype border = screen.attr(PAIR_POPUP_BORDER);
    screen.clearRect(top, left, height, width, screen.attr(PAIR_POPUP_TEXT));
    screen.drawBox(top, left, height, width, border, " Help ", border | A_BOLD);

    int inner = width - 2;
    int maxLines = std::min(height - 2, static_cast<int>(helpLines.size()));
    for (int i = 0; i < maxLines; ++i) {
        const HelpLine& line = helpLines[i];
        int y = top + 1 + i;
        int x = left + 1;

        switch (line.kind) {
            case HelpLine::TITLE: {
                int used = screen.print(y, x, std::string("  ") + line.key, inner, border | A_BOLD);
                screen.print(y, x + used, line.text, inner - used, screen.attr(PAIR_POPUP_DIM));
                break;
            }
            case HelpLine::SECTION:
                screen.print(y, x, std::string("  ") + line.key, inner,
                             screen.attr(PAIR_POPUP_STARRED) | A_BOLD);
                break;
            case HelpLine::BINDING: {
                std::string key = std::string("  ") + line.key;
                int pad = 2 + HELP_KEY_COLUMN - PlatformUtils::displayWidth(key);
                key.append(static_cast<size_t>(std::max(pad, 1)), ' ');
                int used = screen.print(y, x, key, inner, border);
                screen.print(y, x + used, line.text, inner - used, screen.attr(PAIR_POPUP_TEXT));
                break;
            }
            case HelpLine::FOOTER:
                screen.print(y, x, std::string("  ") + line.key, inner,
                             screen.attr(PAIR_POPUP_DIM) | A_ITALIC);
                break;
            case HelpLine::BLANK:
                break;
        }
    }
}

// ============================================================================
// Bookmark label popup
// ============================================================================
void Dialogs::drawBookmarkInput(const Controller& controller) {
    Screen& screen = Screen::instance();

    int width = std::min(BOOKMARK_WIDTH, screen.cols() - 4);
    int height = BOOKMARK_HEIGHT;
    if (width < 4 || screen.lines() < height) return;
    int top = (screen.lines() - height) / 2;
    int left = (screen.cols() - width) / 2;

    chtype border = screen.attr(PAIR_POPUP_STARRED);
    std::string title = " Bookmark: " + PlatformUtils::baseName(controller.bookmarkPath()) + " ";
    screen.clearRect(top, left, height, width, screen.attr(PAIR_POPUP_TEXT));
    screen.drawBox(top, left, height, width, border, title, border | A_BOLD);

    int inner = width - 2;
    screen.print(top + 1, left + 1, "Label (optional):", inner, screen.attr(PAIR_POPUP_DIM));

    // Keep the cursor inside the field by scrolling the text horizontally.
    const LineEdit& input = controller.bookmarkInput();
    std::u32string before = PlatformUtils::decodeUtf8(input.textBeforeCursor());
    std::u32string all = PlatformUtils::decodeUtf8(input.text());
    size_t scroll = 0;
    std::string head = input.textBeforeCursor();
    while (PlatformUtils::displayWidth(head) >= inner && scroll < before.size()) {
        ++scroll;
        head.clear();
        for (size_t i = scroll; i < before.size(); ++i) {
            head += PlatformUtils::encodeUtf8(before[i]);
        }
    }
    std::string shown;
    for (size_t i = scroll; i < all.size(); ++i) {
        shown += PlatformUtils::encodeUtf8(all[i]);
    }

    screen.print(top + 2, left + 1, shown, inner, screen.attr(PAIR_POPUP_TEXT));
    screen.placeCursor(top + 2, left + 1 + PlatformUtils::displayWidth(head));
}

} // namespace treenav
