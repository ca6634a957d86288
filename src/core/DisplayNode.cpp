#include "DisplayNode.h"

namespace treenav {

DisplayNode* DisplayNode::addChild(std::unique_ptr<DisplayNode> child) {
    child->parent = this;
    DisplayNode* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

int DisplayNode::depth() const {
    int d = 0;
    for (const DisplayNode* cur = parent; cur != nullptr; cur = cur->parent) {
        ++d;
    }
    return d;
}

static void flattenRecursive(const DisplayNode* node, int depth, std::vector<Row>& rows) {
    rows.push_back(Row{node, depth});
    for (const auto& child : node->children) {
        flattenRecursive(child.get(), depth + 1, rows);
    }
}

std::vector<Row> flattenForest(const Forest& forest) {
    std::vector<Row> rows;
    for (const auto& node : forest) {
        flattenRecursive(node.get(), 0, rows);
    }
    return rows;
}

int findRow(const std::vector<Row>& rows, const std::string& path) {
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].node->path == path) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace treenav
