#pragma once

#include "core/DisplayNode.h"

#include <optional>
#include <string>
#include <vector>

namespace treenav {

struct SearchCandidate {
    std::string path;
    bool isDir = false;
};

struct SearchMatch {
    std::string path;
    int score = 0;
    bool isDir = false;
};

// Fuzzy subsequence score of `query` against `haystack`, both compared
// case-insensitively. Each matched character scores 10 right after a
// separator (or at the start), 5 when it directly follows the previous
// match, 1 otherwise. nullopt unless every query character matches in order.
std::optional<int> fuzzyScore(const std::string& haystack, const std::string& query);

// ============================================================================
// SearchIndex - ranks the nodes of a frozen forest snapshot
//
// The snapshot holds only what was already on screen, so queries never touch
// the filesystem. There is no incremental index; every query rescans.
// ============================================================================

class SearchIndex {
public:
    // Capture every node of the forest as a candidate.
    void snapshot(const Forest& forest);
    void clear() { candidates_.clear(); }

    // Matches by basename, best first (stable on ties), at most
    // MAX_SEARCH_RESULTS. An empty query matches everything with score 0.
    std::vector<SearchMatch> query(const std::string& q) const;

    const std::vector<SearchCandidate>& candidates() const { return candidates_; }

    // Paths from just below `root` down to `target`, top first. Empty when
    // `target` is not below `root`.
    static std::vector<std::string> ancestorChain(const std::string& root, const std::string& target);

private:
    std::vector<SearchCandidate> candidates_;
};

} // namespace treenav
