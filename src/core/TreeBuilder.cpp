#include "TreeBuilder.h"
#include "Icons.h"
#include "PlatformUtils.h"
#include "search/SearchIndex.h"
#include "size/SizeCache.h"
#include "state/PersistentState.h"

#include <algorithm>

namespace treenav {

namespace fs = std::filesystem;

static constexpr const char* STAR_MARK     = " \xe2\x98\x85";          // " ★"
static constexpr const char* STARRED_ICON  = "\xe2\x98\x85";           // ★
static constexpr const char* BOOKMARK_ICON = "\xf0\x9f\x93\x8c";       // 📌
static constexpr const char* RECENT_ICON   = "\xe2\x8f\xb1";           // ⏱

static bool pathExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

static bool pathIsDir(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

// ============================================================================
// build - top level of the Tree view
// ============================================================================
Forest TreeBuilder::build(const std::string& root,
                          const PersistentState& state,
                          const SizeCache& sizes) const {
    Forest forest;

    std::vector<Entry> entries;
    std::error_code ec;
    if (!readEntries(root, state.showHidden, entries, ec)) {
        auto node = std::make_unique<DisplayNode>();
        node->type = NODE_ERROR_DIR;
        node->error = classifyError(ec);
        node->path = root;
        node->name = root;
        node->label = formatLabel(root, true, false, state.isStarred(root), nullptr) +
                      " [" + readErrorNames[node->error] + "]";
        forest.push_back(std::move(node));
        return forest;
    }

    for (const auto& entry : entries) {
        forest.push_back(buildNode(entry, state, sizes));
    }
    return forest;
}

std::unique_ptr<DisplayNode> TreeBuilder::buildNode(const Entry& entry,
                                                    const PersistentState& state,
                                                    const SizeCache& sizes) const {
    auto node = std::make_unique<DisplayNode>();
    node->path = entry.path.string();
    node->name = entry.name;
    node->starred = state.isStarred(node->path);

    if (!entry.isDir) {
        node->type = NODE_FILE;
        node->label = formatLabel(node->path, false, false, node->starred, nullptr);
        return node;
    }

    bool expanded = state.isExpanded(node->path);
    node->label = formatLabel(node->path, true, expanded, node->starred, &sizes);

    if (!expanded) {
        node->type = NODE_DIRECTORY;
        return node;
    }

    std::vector<Entry> entries;
    std::error_code ec;
    if (!readEntries(entry.path, state.showHidden, entries, ec)) {
        // Siblings are unaffected; this subtree becomes an error leaf.
        node->type = NODE_ERROR_DIR;
        node->error = classifyError(ec);
        node->label += " [";
        node->label += readErrorNames[node->error];
        node->label += "]";
        return node;
    }

    node->type = NODE_EXPANDED_DIR;
    for (const auto& child : entries) {
        node->addChild(buildNode(child, state, sizes));
    }
    return node;
}

bool TreeBuilder::readEntries(const fs::path& dirPath, bool showHidden,
                              std::vector<Entry>& out, std::error_code& ec) const {
    out.clear();
    if (readCb_) {
        readCb_(dirPath.string());
    }

    auto dirIt = fs::directory_iterator(dirPath, ec);
    if (ec) {
        return false;
    }

    while (dirIt != fs::directory_iterator()) {
        const auto& entry = *dirIt;

        Entry e;
        e.path = entry.path();
        e.name = e.path.filename().string();

        if (showHidden || !PlatformUtils::isHidden(e.name)) {
            std::error_code typeEc;
            e.isDir = entry.is_directory(typeEc);   // follows symlinks
            if (typeEc) {
                e.isDir = false;
            }
            out.push_back(std::move(e));
        }

        dirIt.increment(ec);
        if (ec) {
            return false;
        }
    }

    sortEntries(out);
    return true;
}

void TreeBuilder::sortEntries(std::vector<Entry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.isDir != b.isDir) {
            return a.isDir;   // dirs first
        }
        return PlatformUtils::lessIgnoreCase(a.name, b.name);
    });
}

// ============================================================================
// Flat derived views
// ============================================================================
static std::unique_ptr<DisplayNode> makeFlatNode(const std::string& path, std::string label) {
    auto node = std::make_unique<DisplayNode>();
    node->type = pathIsDir(path) ? NODE_DIRECTORY : NODE_FILE;
    node->path = path;
    node->name = path;
    node->label = std::move(label);
    return node;
}

Forest TreeBuilder::buildStarredList(const std::set<std::string>& starredDirs) const {
    std::vector<std::string> dirs(starredDirs.begin(), starredDirs.end());
    std::stable_sort(dirs.begin(), dirs.end(), [](const std::string& a, const std::string& b) {
        return PlatformUtils::lessIgnoreCase(PlatformUtils::baseName(a), PlatformUtils::baseName(b));
    });

    Forest forest;
    for (const auto& path : dirs) {
        if (!pathExists(path)) continue;
        auto node = makeFlatNode(path, std::string(STARRED_ICON) + " " + path);
        node->starred = true;
        forest.push_back(std::move(node));
    }
    return forest;
}

Forest TreeBuilder::buildBookmarksList(const std::vector<Bookmark>& bookmarks) const {
    Forest forest;
    for (const auto& b : bookmarks) {
        if (!pathExists(b.path)) continue;

        std::string label = std::string(BOOKMARK_ICON) + " ";
        if (b.label.empty()) {
            label += b.path;
        } else {
            label += b.label + " (" + PlatformUtils::baseName(b.path) + ")";
        }
        forest.push_back(makeFlatNode(b.path, std::move(label)));
    }
    return forest;
}

Forest TreeBuilder::buildRecentList(const std::deque<std::string>& recentDirs) const {
    Forest forest;
    for (const auto& path : recentDirs) {
        if (!pathExists(path)) continue;
        forest.push_back(makeFlatNode(path, std::string(RECENT_ICON) + " " + path));
    }
    return forest;
}

Forest TreeBuilder::buildSearchResults(const std::vector<SearchMatch>& matches) const {
    Forest forest;
    for (const auto& match : matches) {
        auto node = std::make_unique<DisplayNode>();
        node->type = match.isDir ? NODE_DIRECTORY : NODE_FILE;
        node->path = match.path;
        node->name = PlatformUtils::baseName(match.path);
        node->label = std::string(match.isDir ? Icons::dirIcon(false) : Icons::fileIcon(node->name)) +
                      " " + node->name;
        forest.push_back(std::move(node));
    }
    return forest;
}

// ============================================================================
// Labels and errors
// ============================================================================
std::string TreeBuilder::formatLabel(const std::string& path,
                                     bool isDir,
                                     bool expanded,
                                     bool starred,
                                     const SizeCache* sizes) {
    std::string name = PlatformUtils::baseName(path);

    std::string label = isDir ? Icons::dirIcon(expanded) : Icons::fileIcon(name);
    label += " ";
    label += name;

    if (starred) {
        label += STAR_MARK;
    }

    if (isDir && expanded && sizes) {
        switch (sizes->state(path)) {
            case SIZE_PENDING:
                label += " [...]";
                break;
            case SIZE_RESOLVED:
                label += " [" + PlatformUtils::formatSize(*sizes->bytes(path)) + "]";
                break;
            case SIZE_ABSENT:
                break;
        }
    }

    return label;
}

ReadError TreeBuilder::classifyError(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return READ_PERMISSION_DENIED;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return READ_NOT_FOUND;
    }
    return READ_OTHER;
}

} // namespace treenav
