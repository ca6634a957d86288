#pragma once

#include <string>
#include <vector>

namespace treenav {

struct PreviewContent {
    std::string title;
    std::vector<std::string> lines;
};

namespace Preview {

    // Directory: sorted entry names, directories suffixed with '/'.
    // File: its first PREVIEW_MAX_LINES lines.
    // Empty path: a placeholder.
    PreviewContent build(const std::string& path, bool showHidden);

} // namespace Preview
} // namespace treenav
