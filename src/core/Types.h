#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace treenav {

// ============================================================================
// Color types
// ============================================================================

struct RGBcolor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

// ============================================================================
// Enumerations
// ============================================================================

// Node states in a built forest. NODE_DIRECTORY means "not expanded, never
// read"; NODE_EXPANDED_DIR means "read", even when it has no children.
enum NodeType {
    NODE_FILE = 0,
    NODE_DIRECTORY,
    NODE_EXPANDED_DIR,
    NODE_ERROR_DIR,
    NUM_NODE_TYPES
};

enum ReadError {
    READ_OK = 0,
    READ_PERMISSION_DENIED,
    READ_NOT_FOUND,
    READ_OTHER
};

enum ViewMode {
    VIEW_TREE = 0,
    VIEW_STARRED,
    VIEW_BOOKMARKS,
    VIEW_RECENT
};

enum InputMode {
    INPUT_NORMAL = 0,
    INPUT_SEARCH,
    INPUT_BOOKMARK_LABEL
};

// ============================================================================
// Limits
// ============================================================================

inline constexpr std::size_t MAX_RECENT_DIRS      = 50;
inline constexpr std::size_t MAX_SEARCH_RESULTS   = 50;
inline constexpr std::size_t SIZE_QUEUE_CAPACITY  = 100;
inline constexpr int         INPUT_POLL_MS        = 50;
inline constexpr double      DOUBLE_CLICK_SECONDS = 0.4;
inline constexpr int         SCROLL_LINES         = 3;
inline constexpr int         PREVIEW_MAX_LINES    = 100;

// ============================================================================
// Name arrays
// ============================================================================

inline const char* const readErrorNames[] = {
    "OK",                   // READ_OK
    "Permission denied",    // READ_PERMISSION_DENIED
    "Not found",            // READ_NOT_FOUND
    "Error"                 // READ_OTHER
};

inline const char* const viewModeTitles[] = {
    "",                                 // VIEW_TREE (root path is used instead)
    "\xe2\x98\x85 Starred",             // VIEW_STARRED
    "\xf0\x9f\x93\x8c Bookmarks",       // VIEW_BOOKMARKS
    "\xe2\x8f\xb1 Recent"               // VIEW_RECENT
};

} // namespace treenav
