#include "nav/LineEdit.h"
#include "core/PlatformUtils.h"

namespace treenav {

void LineEdit::setText(const std::string& text) {
    text_ = PlatformUtils::decodeUtf8(text);
    cursor_ = text_.size();
}

void LineEdit::clear() {
    text_.clear();
    cursor_ = 0;
}

void LineEdit::insert(char32_t cp) {
    text_.insert(text_.begin() + static_cast<std::ptrdiff_t>(cursor_), cp);
    ++cursor_;
}

void LineEdit::backspace() {
    if (cursor_ == 0) return;
    text_.erase(cursor_ - 1, 1);
    --cursor_;
}

void LineEdit::deleteForward() {
    if (cursor_ >= text_.size()) return;
    text_.erase(cursor_, 1);
}

void LineEdit::moveLeft() {
    if (cursor_ > 0) --cursor_;
}

void LineEdit::moveRight() {
    if (cursor_ < text_.size()) ++cursor_;
}

std::string LineEdit::text() const {
    std::string out;
    for (char32_t cp : text_) {
        out += PlatformUtils::encodeUtf8(cp);
    }
    return out;
}

std::string LineEdit::textBeforeCursor() const {
    std::string out;
    for (size_t i = 0; i < cursor_; ++i) {
        out += PlatformUtils::encodeUtf8(text_[i]);
    }
    return out;
}

} // namespace treenav
