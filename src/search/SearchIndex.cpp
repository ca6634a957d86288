#include "search/SearchIndex.h"
#include "core/PlatformUtils.h"
#include "core/Types.h"

#include <algorithm>
#include <cwctype>
#include <filesystem>

namespace treenav {

static bool isSeparator(char32_t c) {
    return c == U'/' || c == U'.' || c == U'_' || c == U'-' || c == U' ';
}

// Simple per-code-point lowercase under the current LC_CTYPE.
static char32_t foldCase(char32_t c) {
    return static_cast<char32_t>(std::towlower(static_cast<std::wint_t>(c)));
}

std::optional<int> fuzzyScore(const std::string& haystack, const std::string& query) {
    std::u32string needle = PlatformUtils::decodeUtf8(query);
    if (needle.empty()) {
        return 0;
    }
    for (char32_t& c : needle) {
        c = foldCase(c);
    }

    int score = 0;
    size_t needleIdx = 0;
    bool prevMatch = false;
    bool prevWasSeparator = true;

    for (char32_t raw : PlatformUtils::decodeUtf8(haystack)) {
        char32_t c = foldCase(raw);
        bool separator = isSeparator(c);

        if (needleIdx < needle.size() && c == needle[needleIdx]) {
            if (prevWasSeparator) {
                score += 10;
            } else if (prevMatch) {
                score += 5;
            } else {
                score += 1;
            }
            ++needleIdx;
            prevMatch = true;
        } else {
            prevMatch = false;
        }
        prevWasSeparator = separator;
    }

    if (needleIdx != needle.size()) {
        return std::nullopt;
    }
    return score;
}

void SearchIndex::snapshot(const Forest& forest) {
    candidates_.clear();
    for (const Row& row : flattenForest(forest)) {
        candidates_.push_back(SearchCandidate{row.node->path, row.node->isDir()});
    }
}

std::vector<SearchMatch> SearchIndex::query(const std::string& q) const {
    std::vector<SearchMatch> matches;
    for (const auto& candidate : candidates_) {
        auto score = fuzzyScore(PlatformUtils::baseName(candidate.path), q);
        if (score) {
            matches.push_back(SearchMatch{candidate.path, *score, candidate.isDir});
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const SearchMatch& a, const SearchMatch& b) { return a.score > b.score; });

    if (matches.size() > MAX_SEARCH_RESULTS) {
        matches.resize(MAX_SEARCH_RESULTS);
    }
    return matches;
}

std::vector<std::string> SearchIndex::ancestorChain(const std::string& root, const std::string& target) {
    std::vector<std::string> chain;
    if (!PlatformUtils::isWithin(target, root) || target == root) {
        return chain;
    }

    std::filesystem::path current(target);
    while (current.string() != root && PlatformUtils::isWithin(current.string(), root)) {
        chain.push_back(current.string());
        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

} // namespace treenav
