#pragma once

#include "DisplayNode.h"
#include "Types.h"

#include <deque>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace treenav {

class PersistentState;
class SizeCache;
struct Bookmark;
struct SearchMatch;

// Invoked with the path of every directory whose entries are read.
using DirReadCallback = std::function<void(const std::string& dirPath)>;

// ============================================================================
// TreeBuilder - maps (root, state, size cache) to a forest
//
// Only directories in the expanded set are read, so the amount of I/O is
// bounded by what the user chose to look at. Every call builds a new forest
// from scratch.
// ============================================================================

class TreeBuilder {
public:
    // Children of `root`, recursing into expanded directories. A root that
    // cannot be read yields a single error node for the root itself.
    Forest build(const std::string& root,
                 const PersistentState& state,
                 const SizeCache& sizes) const;

    // Flat derived views. Paths that no longer exist are left out.
    Forest buildStarredList(const std::set<std::string>& starredDirs) const;
    Forest buildBookmarksList(const std::vector<Bookmark>& bookmarks) const;
    Forest buildRecentList(const std::deque<std::string>& recentDirs) const;

    // Flat list of search hits, in rank order. Touches no files.
    Forest buildSearchResults(const std::vector<SearchMatch>& matches) const;

    void setReadCallback(DirReadCallback cb) { readCb_ = std::move(cb); }

    // Map an I/O error to the coarse category shown to the user.
    static ReadError classifyError(const std::error_code& ec);

    // "<icon> <name>[ ★][ [size]]"
    static std::string formatLabel(const std::string& path,
                                   bool isDir,
                                   bool expanded,
                                   bool starred,
                                   const SizeCache* sizes);

private:
    struct Entry {
        std::filesystem::path path;
        std::string name;
        bool isDir = false;
    };

    // Read and sort the visible entries of a directory.
    bool readEntries(const std::filesystem::path& dirPath, bool showHidden,
                     std::vector<Entry>& out, std::error_code& ec) const;

    std::unique_ptr<DisplayNode> buildNode(const Entry& entry,
                                           const PersistentState& state,
                                           const SizeCache& sizes) const;

    // Directories first, then case-insensitive by name.
    static void sortEntries(std::vector<Entry>& entries);

    DirReadCallback readCb_;
};

} // namespace treenav
