#pragma once

#include "core/Preview.h"

#include <string>

namespace treenav {

class Controller;

// Tree list (with the optional preview pane beside it) above the footer line.
class TreePanel {
public:
    static TreePanel& instance();

    // Lay out, scroll to the cursor and draw. Updates the controller's
    // visible height.
    void draw(Controller& controller);

    // Row index under screen cell (y, x), or -1.
    int rowAt(int y, int x) const;

private:
    TreePanel() = default;

    void drawTree(const Controller& controller);
    void drawPreview(const Controller& controller);
    void scrollToCursor(const Controller& controller);

    // Tree box geometry from the last draw
    int top_ = 0;
    int left_ = 0;
    int height_ = 0;
    int width_ = 0;
    int scrollTop_ = 0;
    int rowCount_ = 0;

    // Preview geometry and cache
    int previewLeft_ = 0;
    int previewWidth_ = 0;
    std::string previewPath_;
    bool previewHidden_ = false;
    bool previewValid_ = false;
    PreviewContent preview_;
};

} // namespace treenav
