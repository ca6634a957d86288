#include "ui/Screen.h"
#include "core/PlatformUtils.h"
#include "core/Types.h"

#include <clocale>
#include <cmath>
#include <iostream>

namespace treenav {

static constexpr int ESCAPE_DELAY_MS = 25;

Screen& Screen::instance() {
    static Screen s;
    return s;
}

// ============================================================================
// Lifecycle
// ============================================================================
bool Screen::init(const Theme& theme) {
    std::setlocale(LC_ALL, "");

    tty_ = std::fopen("/dev/tty", "r+");
    if (!tty_) {
        std::cerr << "treenav: cannot open /dev/tty" << std::endl;
        return false;
    }

    screen_ = newterm(nullptr, tty_, tty_);
    if (!screen_) {
        std::cerr << "treenav: cannot initialize terminal" << std::endl;
        std::fclose(tty_);
        tty_ = nullptr;
        return false;
    }
    set_term(screen_);

    // raw() so that Ctrl-C arrives as a key instead of SIGINT.
    if (raw() == ERR || noecho() == ERR || nonl() == ERR || keypad(stdscr, TRUE) == ERR) {
        shutdown();
        std::cerr << "treenav: cannot configure input" << std::endl;
        return false;
    }
    set_escdelay(ESCAPE_DELAY_MS);
    timeout(INPUT_POLL_MS);
    curs_set(0);

    // Clicks are reported on press; double clicks are detected by the
    // controller.
    mouseinterval(0);
    mousemask(BUTTON1_PRESSED | BUTTON4_PRESSED | BUTTON5_PRESSED, nullptr);

    initColors(theme);
    return true;
}

void Screen::shutdown() {
    if (screen_) {
        endwin();
        delscreen(screen_);
        screen_ = nullptr;
    }
    if (tty_) {
        std::fclose(tty_);
        tty_ = nullptr;
    }
}

// ============================================================================
// Colors
// ============================================================================
short Screen::toCursesColor(int r, int g, int b) const {
    if (COLORS >= 256) {
        // xterm 6x6x6 color cube
        auto level = [](int v) { return static_cast<int>(std::lround(v / 255.0 * 5.0)); };
        return static_cast<short>(16 + 36 * level(r) + 6 * level(g) + level(b));
    }
    // Nearest of the 8 basic colors
    short c = 0;
    if (r >= 128) c |= COLOR_RED;
    if (g >= 128) c |= COLOR_GREEN;
    if (b >= 128) c |= COLOR_BLUE;
    return c;
}

short Screen::toCursesColor(const ThemeColor& color) const {
    if (color.index >= 0) {
        return static_cast<short>(COLORS >= 16 ? color.index : color.index % 8);
    }
    return toCursesColor(static_cast<int>(std::lround(color.rgb.r * 255.0f)),
                         static_cast<int>(std::lround(color.rgb.g * 255.0f)),
                         static_cast<int>(std::lround(color.rgb.b * 255.0f)));
}

void Screen::initColors(const Theme& theme) {
    // Bail out on dumb terminals; attributes alone still work there.
    colors_ = has_colors() && start_color() != ERR && use_default_colors() != ERR;
    if (!colors_) {
        return;
    }

    short border = toCursesColor(theme.border);
    short highlight = toCursesColor(theme.highlightBg);
    short starred = toCursesColor(theme.starred);
    short dim = toCursesColor(theme.dim);
    short text = toCursesColor(theme.text);
    short barBg = toCursesColor(20, 20, 30);
    short popupBg = toCursesColor(15, 15, 25);

    init_pair(PAIR_TEXT, text, -1);
    init_pair(PAIR_BORDER, border, -1);
    init_pair(PAIR_STARRED, starred, -1);
    init_pair(PAIR_DIM, dim, -1);
    init_pair(PAIR_HIGHLIGHT, text, highlight);
    init_pair(PAIR_BAR_TEXT, text, barBg);
    init_pair(PAIR_BAR_KEY, border, barBg);
    init_pair(PAIR_BAR_DIM, dim, barBg);
    init_pair(PAIR_POPUP_TEXT, text, popupBg);
    init_pair(PAIR_POPUP_BORDER, border, popupBg);
    init_pair(PAIR_POPUP_STARRED, starred, popupBg);
    init_pair(PAIR_POPUP_DIM, dim, popupBg);
}

chtype Screen::attr(ColorPair pair) const {
    if (colors_) {
        return COLOR_PAIR(pair);
    }
    return pair == PAIR_HIGHLIGHT ? A_REVERSE : A_NORMAL;
}

// ============================================================================
// Input
// ============================================================================
bool Screen::poll(TermEvent& ev) {
    ev = TermEvent();
    wint_t ch = 0;
    int res = get_wch(&ch);
    if (res == ERR) {
        return false;
    }
    return decodeKey(res, ch, ev);
}

bool Screen::decodeKey(int res, wint_t ch, TermEvent& ev) {
    ev.kind = TERM_KEY;
    KeyEvent& key = ev.key;

    if (res == KEY_CODE_YES) {
        switch (ch) {
            case KEY_UP:        key.code = KeyCode::Up; return true;
            case KEY_DOWN:      key.code = KeyCode::Down; return true;
            case KEY_LEFT:      key.code = KeyCode::Left; return true;
            case KEY_RIGHT:     key.code = KeyCode::Right; return true;
            case KEY_HOME:      key.code = KeyCode::Home; return true;
            case KEY_END:       key.code = KeyCode::End; return true;
            case KEY_PPAGE:     key.code = KeyCode::PageUp; return true;
            case KEY_NPAGE:     key.code = KeyCode::PageDown; return true;
            case KEY_DC:        key.code = KeyCode::Delete; return true;
            case KEY_BACKSPACE: key.code = KeyCode::Backspace; return true;
            case KEY_BTAB:      key.code = KeyCode::BackTab; return true;
            case KEY_ENTER:     key.code = KeyCode::Enter; return true;
            case KEY_RESIZE:
                ev.kind = TERM_RESIZE;
                return true;
            case KEY_MOUSE: {
                MEVENT me;
                if (getmouse(&me) != OK) {
                    return false;
                }
                ev.kind = TERM_MOUSE;
                ev.x = me.x;
                ev.y = me.y;
                if (me.bstate & BUTTON1_PRESSED) {
                    ev.mouseAction = MouseAction::LeftClick;
                } else if (me.bstate & BUTTON4_PRESSED) {
                    ev.mouseAction = MouseAction::ScrollUp;
                } else if (me.bstate & BUTTON5_PRESSED) {
                    ev.mouseAction = MouseAction::ScrollDown;
                } else {
                    return false;
                }
                return true;
            }
            default:
                return false;
        }
    }

    switch (ch) {
        case 27:            key.code = KeyCode::Escape; return true;
        case '\r':
        case '\n':          key.code = KeyCode::Enter; return true;
        case '\t':          key.code = KeyCode::Tab; return true;
        case 8:
        case 127:           key.code = KeyCode::Backspace; return true;
        default: break;
    }

    key.code = KeyCode::Char;
    if (ch >= 1 && ch <= 26) {
        key.ctrl = true;
        key.ch = static_cast<char32_t>(U'a' + (ch - 1));
    } else {
        key.ch = static_cast<char32_t>(ch);
    }
    return true;
}

// ============================================================================
// Drawing
// ============================================================================
void Screen::beginFrame() {
    erase();
    cursorY_ = -1;
    cursorX_ = -1;
}

void Screen::present() {
    if (cursorY_ >= 0 && cursorX_ >= 0) {
        move(cursorY_, cursorX_);
        curs_set(1);
    } else {
        curs_set(0);
    }
    refresh();
}

void Screen::placeCursor(int y, int x) {
    cursorY_ = y;
    cursorX_ = x;
}

int Screen::print(int y, int x, const std::string& text, int maxCols, chtype attrs) {
    if (maxCols <= 0 || y < 0 || y >= LINES || x < 0 || x >= COLS) {
        return 0;
    }
    if (x + maxCols > COLS) {
        maxCols = COLS - x;
    }
    std::string clipped = PlatformUtils::fitToWidth(text, maxCols);
    attrset(attrs);
    mvaddstr(y, x, clipped.c_str());
    attrset(A_NORMAL);
    return PlatformUtils::displayWidth(clipped);
}

void Screen::fill(int y, int x, int width, chtype attrs) {
    if (width <= 0 || y < 0 || y >= LINES) {
        return;
    }
    attrset(attrs);
    mvhline(y, x, ' ', width);
    attrset(A_NORMAL);
}

void Screen::clearRect(int y, int x, int height, int width, chtype attrs) {
    for (int row = 0; row < height; ++row) {
        fill(y + row, x, width, attrs);
    }
}

void Screen::drawBox(int y, int x, int height, int width, chtype borderAttrs,
                     const std::string& title, chtype titleAttrs) {
    if (height < 2 || width < 2) {
        return;
    }

    attrset(borderAttrs);
    mvhline(y, x + 1, ACS_HLINE, width - 2);
    mvhline(y + height - 1, x + 1, ACS_HLINE, width - 2);
    mvvline(y + 1, x, ACS_VLINE, height - 2);
    mvvline(y + 1, x + width - 1, ACS_VLINE, height - 2);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + width - 1, ACS_URCORNER);
    mvaddch(y + height - 1, x, ACS_LLCORNER);
    mvaddch(y + height - 1, x + width - 1, ACS_LRCORNER);
    attrset(A_NORMAL);

    if (!title.empty()) {
        print(y, x + 1, title, width - 2, titleAttrs);
    }
}

} // namespace treenav
