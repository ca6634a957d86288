#include "Preview.h"
#include "PlatformUtils.h"
#include "Types.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace treenav {
namespace Preview {

namespace fs = std::filesystem;

static std::vector<std::string> listDirectory(const fs::path& dirPath, bool showHidden) {
    std::vector<std::string> dirs;
    std::vector<std::string> files;

    std::error_code ec;
    auto dirIt = fs::directory_iterator(dirPath, ec);
    if (ec) {
        return {};
    }

    while (dirIt != fs::directory_iterator()) {
        std::string name = dirIt->path().filename().string();
        if (showHidden || !PlatformUtils::isHidden(name)) {
            std::error_code typeEc;
            if (dirIt->is_directory(typeEc)) {
                dirs.push_back(name + "/");
            } else {
                files.push_back(name);
            }
        }
        dirIt.increment(ec);
        if (ec) {
            break;
        }
    }

    std::sort(dirs.begin(), dirs.end(), PlatformUtils::lessIgnoreCase);
    std::sort(files.begin(), files.end(), PlatformUtils::lessIgnoreCase);
    dirs.insert(dirs.end(), files.begin(), files.end());
    return dirs;
}

PreviewContent build(const std::string& path, bool showHidden) {
    PreviewContent content;
    if (path.empty()) {
        content.title = "Preview";
        content.lines.push_back("Select a file or directory");
        return content;
    }

    content.title = PlatformUtils::baseName(path);

    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec) {
        content.title = "Preview";
        content.lines.push_back("Select a file or directory");
        return content;
    }

    if (status.type() == fs::file_type::directory) {
        content.lines = listDirectory(path, showHidden);
        return content;
    }

    if (status.type() == fs::file_type::regular) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            content.lines.push_back("[Unable to read file]");
            return content;
        }
        std::string line;
        while (static_cast<int>(content.lines.size()) < PREVIEW_MAX_LINES && std::getline(ifs, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            content.lines.push_back(line);
        }
        return content;
    }

    content.title = "Preview";
    content.lines.push_back("Select a file or directory");
    return content;
}

} // namespace Preview
} // namespace treenav
