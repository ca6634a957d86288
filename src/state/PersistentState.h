#pragma once

#include <cstdint>
#include <deque>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace treenav {

struct Bookmark {
    std::string path;
    std::string label;
    int64_t createdAt = 0;   // seconds since the Unix epoch
};

// ============================================================================
// PersistentState - session state that survives restarts
//
// Loaded once at startup and saved once at clean exit. Nothing is written in
// between, so a crash loses the changes of the running session.
// ============================================================================

class PersistentState {
public:
    std::set<std::string> expandedDirs;
    std::set<std::string> starredDirs;
    std::vector<Bookmark> bookmarks;
    std::deque<std::string> recentDirs;   // most recent first
    bool showHidden = false;

    // Default location of the state file.
    static std::string getStatePath();

    // Read state from `path`. A missing, unreadable or malformed file yields
    // the defaults; never throws.
    static PersistentState load(const std::string& path);

    // Write state to `path`, creating parent directories. Failures are
    // dropped.
    void save(const std::string& path) const;

    // --- Expanded / starred sets (idempotent) ---

    bool isExpanded(const std::string& path) const { return expandedDirs.count(path) > 0; }
    void setExpanded(const std::string& path, bool expanded);

    bool isStarred(const std::string& path) const { return starredDirs.count(path) > 0; }
    void setStarred(const std::string& path, bool starred);
    void toggleStarred(const std::string& path);

    // --- Bookmarks ---

    // Replaces an existing bookmark for the same path; createdAt is now.
    void addBookmark(const std::string& path, const std::string& label);
    const Bookmark* findBookmark(const std::string& path) const;

    // --- Recent ---

    // Move-to-front without duplicates; keeps at most MAX_RECENT_DIRS.
    void addRecent(const std::string& path);

    nlohmann::json toJson() const;
    static PersistentState fromJson(const nlohmann::json& j);
};

} // namespace treenav
