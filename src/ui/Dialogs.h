#pragma once

namespace treenav {

class Controller;

// Centered popups drawn over the tree: help and the bookmark label editor.
class Dialogs {
public:
    static Dialogs& instance();
    void draw(const Controller& controller);

private:
    Dialogs() = default;

    void drawHelp();
    void drawBookmarkInput(const Controller& controller);
};

} // namespace treenav
