#pragma once

#include "app/Config.h"
#include "nav/InputEvent.h"

#include <curses.h>
#include <cstdio>
#include <string>

namespace treenav {

enum ColorPair {
    PAIR_TEXT = 1,
    PAIR_BORDER,
    PAIR_STARRED,
    PAIR_DIM,
    PAIR_HIGHLIGHT,
    PAIR_BAR_TEXT,
    PAIR_BAR_KEY,
    PAIR_BAR_DIM,
    PAIR_POPUP_TEXT,
    PAIR_POPUP_BORDER,
    PAIR_POPUP_STARRED,
    PAIR_POPUP_DIM,
    NUM_COLOR_PAIRS
};

enum TermEventKind {
    TERM_NONE = 0,
    TERM_KEY,
    TERM_MOUSE,
    TERM_RESIZE
};

// Raw terminal input after decoding. Mouse events still carry screen
// coordinates; the tree panel maps them to rows.
struct TermEvent {
    TermEventKind kind = TERM_NONE;
    KeyEvent key;
    MouseAction mouseAction = MouseAction::LeftClick;
    int x = 0;
    int y = 0;
};

// ============================================================================
// Screen - curses session on the controlling terminal
//
// The session reads and writes /dev/tty, never stdin/stdout, so the chosen
// directory printed on exit can be captured by the shell.
// ============================================================================

class Screen {
public:
    static Screen& instance();

    // Open the terminal and enter curses mode. Logs and returns false on
    // failure.
    bool init(const Theme& theme);
    void shutdown();
    bool isActive() const { return screen_ != nullptr; }

    int lines() const { return LINES; }
    int cols() const { return COLS; }

    // Wait up to INPUT_POLL_MS for one input event.
    bool poll(TermEvent& ev);

    void beginFrame();
    void present();

    chtype attr(ColorPair pair) const;

    // Print UTF-8 text clipped to maxCols cells. Returns the cells used.
    int print(int y, int x, const std::string& text, int maxCols, chtype attrs);

    void fill(int y, int x, int width, chtype attrs);
    void clearRect(int y, int x, int height, int width, chtype attrs);
    void drawBox(int y, int x, int height, int width, chtype borderAttrs,
                 const std::string& title, chtype titleAttrs);

    // Show the hardware cursor at (y, x) for this frame.
    void placeCursor(int y, int x);

private:
    Screen() = default;

    void initColors(const Theme& theme);
    short toCursesColor(const ThemeColor& color) const;
    short toCursesColor(int r, int g, int b) const;
    bool decodeKey(int res, wint_t ch, TermEvent& ev);

    SCREEN* screen_ = nullptr;
    FILE* tty_ = nullptr;
    bool colors_ = false;
    int cursorY_ = -1;
    int cursorX_ = -1;
};

} // namespace treenav
