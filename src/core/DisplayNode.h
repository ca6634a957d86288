#pragma once

#include "Types.h"

#include <memory>
#include <string>
#include <vector>

namespace treenav {

class DisplayNode;

// An ordered list of top-level nodes. Immutable once built; a mutation
// produces a new forest.
using Forest = std::vector<std::unique_ptr<DisplayNode>>;

// ============================================================================
// DisplayNode - one row-producing entry of a built forest
// ============================================================================

class DisplayNode {
public:
    NodeType type = NODE_FILE;
    ReadError error = READ_OK;

    // Absolute path; unique within a forest.
    std::string path;

    // Basename (or full path for flat-view entries).
    std::string name;

    // Fully formatted text shown by the renderer.
    std::string label;

    bool starred = false;

    DisplayNode* parent = nullptr;
    std::vector<std::unique_ptr<DisplayNode>> children;

    // --- Inline helpers ---

    bool isDir() const { return type != NODE_FILE; }
    bool isExpanded() const { return type == NODE_EXPANDED_DIR; }
    bool isError() const { return type == NODE_ERROR_DIR; }

    size_t childCount() const { return children.size(); }

    // --- Methods implemented in .cpp ---

    // Add a child node; sets child's parent pointer. Returns raw pointer.
    DisplayNode* addChild(std::unique_ptr<DisplayNode> child);

    // Number of ancestors above this node within its forest.
    int depth() const;
};

// ============================================================================
// Flattened view of a forest, in display order
// ============================================================================

struct Row {
    const DisplayNode* node = nullptr;
    int depth = 0;
};

// Depth-first walk of the forest; children of expanded directories follow
// their parent.
std::vector<Row> flattenForest(const Forest& forest);

// Index of the row whose node has the given path, or -1.
int findRow(const std::vector<Row>& rows, const std::string& path);

} // namespace treenav
