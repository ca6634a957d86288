#pragma once

#include <string>

namespace treenav {

// Single-line text buffer with a cursor, edited one code point at a time.
class LineEdit {
public:
    LineEdit() = default;
    explicit LineEdit(const std::string& text) { setText(text); }

    void setText(const std::string& text);
    void clear();

    void insert(char32_t cp);
    void backspace();
    void deleteForward();
    void moveLeft();
    void moveRight();
    void moveHome() { cursor_ = 0; }
    void moveEnd() { cursor_ = text_.size(); }

    // UTF-8 contents.
    std::string text() const;
    bool empty() const { return text_.empty(); }

    // Cursor position in code points.
    size_t cursor() const { return cursor_; }

    // UTF-8 text before the cursor (for placing the terminal cursor).
    std::string textBeforeCursor() const;

private:
    std::u32string text_;
    size_t cursor_ = 0;
};

} // namespace treenav
