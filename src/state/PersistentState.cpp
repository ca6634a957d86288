#include "state/PersistentState.h"
#include "core/PlatformUtils.h"
#include "core/Types.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace treenav {

namespace fs = std::filesystem;

std::string PersistentState::getStatePath() {
    return PlatformUtils::dataDir() + "/treenav/state.json";
}

// ============================================================================
// load - parse the state file; any failure falls back to defaults
// ============================================================================
PersistentState PersistentState::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return PersistentState{};
    }

    try {
        nlohmann::json j;
        ifs >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception&) {
        return PersistentState{};
    }
}

// ============================================================================
// save - write the whole state; errors are logged and dropped
// ============================================================================
void PersistentState::save(const std::string& path) const {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "treenav: failed to create " << parent.string() << ": " << ec.message() << std::endl;
            return;
        }
    }

    std::string text;
    try {
        text = toJson().dump(2);
    } catch (const nlohmann::json::exception& e) {
        // Paths that are not valid UTF-8 cannot be serialized.
        std::cerr << "treenav: failed to serialize state: " << e.what() << std::endl;
        return;
    }

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        std::cerr << "treenav: failed to write state to " << path << std::endl;
        return;
    }
    ofs << text << std::endl;
}

void PersistentState::setExpanded(const std::string& path, bool expanded) {
    if (expanded) {
        expandedDirs.insert(path);
    } else {
        expandedDirs.erase(path);
    }
}

void PersistentState::setStarred(const std::string& path, bool starred) {
    if (starred) {
        starredDirs.insert(path);
    } else {
        starredDirs.erase(path);
    }
}

void PersistentState::toggleStarred(const std::string& path) {
    setStarred(path, !isStarred(path));
}

void PersistentState::addBookmark(const std::string& path, const std::string& label) {
    bookmarks.erase(std::remove_if(bookmarks.begin(), bookmarks.end(),
                                   [&](const Bookmark& b) { return b.path == path; }),
                    bookmarks.end());

    Bookmark b;
    b.path = path;
    b.label = label;
    b.createdAt = PlatformUtils::epochSeconds();
    bookmarks.push_back(std::move(b));
}

const Bookmark* PersistentState::findBookmark(const std::string& path) const {
    for (const auto& b : bookmarks) {
        if (b.path == path) {
            return &b;
        }
    }
    return nullptr;
}

void PersistentState::addRecent(const std::string& path) {
    recentDirs.erase(std::remove(recentDirs.begin(), recentDirs.end(), path), recentDirs.end());
    recentDirs.push_front(path);
    while (recentDirs.size() > MAX_RECENT_DIRS) {
        recentDirs.pop_back();
    }
}

// ============================================================================
// toJson - field names match the on-disk format
// ============================================================================
nlohmann::json PersistentState::toJson() const {
    nlohmann::json j;
    j["expanded_dirs"] = expandedDirs;
    j["starred_dirs"] = starredDirs;
    j["show_hidden"] = showHidden;

    nlohmann::json jBookmarks = nlohmann::json::array();
    for (const auto& b : bookmarks) {
        nlohmann::json jb;
        jb["path"] = b.path;
        jb["label"] = b.label;
        jb["created_at"] = b.createdAt;
        jBookmarks.push_back(jb);
    }
    j["bookmarks"] = jBookmarks;

    nlohmann::json jRecent = nlohmann::json::array();
    for (const auto& p : recentDirs) {
        jRecent.push_back(p);
    }
    j["recent_dirs"] = jRecent;

    return j;
}

// ============================================================================
// fromJson - missing or mistyped keys keep their defaults
// ============================================================================
static void readPathSet(const nlohmann::json& j, const char* key, std::set<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) {
        return;
    }
    for (const auto& jp : j[key]) {
        if (jp.is_string()) {
            out.insert(jp.get<std::string>());
        }
    }
}

PersistentState PersistentState::fromJson(const nlohmann::json& j) {
    PersistentState state;
    if (!j.is_object()) {
        return state;
    }

    readPathSet(j, "expanded_dirs", state.expandedDirs);
    readPathSet(j, "starred_dirs", state.starredDirs);

    if (j.contains("show_hidden") && j["show_hidden"].is_boolean()) {
        state.showHidden = j["show_hidden"].get<bool>();
    }

    if (j.contains("bookmarks") && j["bookmarks"].is_array()) {
        for (const auto& jb : j["bookmarks"]) {
            if (!jb.is_object() || !jb.contains("path") || !jb["path"].is_string()) {
                continue;
            }
            Bookmark b;
            b.path = jb["path"].get<std::string>();
            if (jb.contains("label") && jb["label"].is_string()) {
                b.label = jb["label"].get<std::string>();
            }
            if (jb.contains("created_at") && jb["created_at"].is_number_integer()) {
                b.createdAt = jb["created_at"].get<int64_t>();
            }
            // Paths are unique; a later duplicate replaces the earlier one.
            state.bookmarks.erase(std::remove_if(state.bookmarks.begin(), state.bookmarks.end(),
                                                 [&](const Bookmark& o) { return o.path == b.path; }),
                                  state.bookmarks.end());
            state.bookmarks.push_back(std::move(b));
        }
    }

    if (j.contains("recent_dirs") && j["recent_dirs"].is_array()) {
        for (const auto& jp : j["recent_dirs"]) {
            if (!jp.is_string()) continue;
            std::string p = jp.get<std::string>();
            if (std::find(state.recentDirs.begin(), state.recentDirs.end(), p) != state.recentDirs.end()) {
                continue;
            }
            state.recentDirs.push_back(std::move(p));
            if (state.recentDirs.size() >= MAX_RECENT_DIRS) {
                break;
            }
        }
    }

    return state;
}

} // namespace treenav
