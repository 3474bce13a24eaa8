#include <regdoc/core/errors.h>
#include <regdoc/structure/document_structure.h>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace regdoc::structure {

Result<void> DocumentStructure::addNode(ChapterNode node) {
    if (node.nodeId.empty()) {
        return errors::invalidArgument("Chapter node without id");
    }
    if (nodes_.count(node.nodeId) > 0) {
        return errors::invalidArgument(fmt::format("Duplicate chapter node id: {}", node.nodeId));
    }
    if (node.parentId) {
        auto parent = nodes_.find(*node.parentId);
        if (parent == nodes_.end()) {
            return errors::invalidArgument(
                fmt::format("Parent {} of node {} does not exist", *node.parentId, node.nodeId));
        }
        parent->second.childrenIds.push_back(node.nodeId);
    } else {
        rootIds_.push_back(node.nodeId);
    }

    if (!node.sectionNumber.empty()) {
        bySection_.emplace(node.sectionNumber, node.nodeId);
    }
    order_.push_back(node.nodeId);
    auto id = node.nodeId;
    nodes_.emplace(std::move(id), std::move(node));
    return {};
}

ChapterNode* DocumentStructure::mutableNode(std::string_view nodeId) {
    auto it = nodes_.find(std::string(nodeId));
    return it == nodes_.end() ? nullptr : &it->second;
}

const ChapterNode* DocumentStructure::getNode(std::string_view nodeId) const {
    auto it = nodes_.find(std::string(nodeId));
    return it == nodes_.end() ? nullptr : &it->second;
}

const ChapterNode* DocumentStructure::getNodeBySectionNumber(std::string_view sectionNumber) const {
    auto it = bySection_.find(std::string(sectionNumber));
    if (it == bySection_.end()) {
        return nullptr;
    }
    return getNode(it->second);
}

std::vector<std::string> DocumentStructure::getChapterPath(std::string_view nodeId) const {
    std::vector<std::string> path;
    const ChapterNode* node = getNode(nodeId);
    // Bounded by node count so a malformed parent cycle cannot loop forever
    size_t guard = nodes_.size();
    while (node && guard-- > 0) {
        path.push_back(node->fullTitle());
        node = node->parentId ? getNode(*node->parentId) : nullptr;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<std::string> DocumentStructure::descendantIds(std::string_view nodeId) const {
    std::vector<std::string> out;
    const ChapterNode* root = getNode(nodeId);
    if (!root) {
        return out;
    }
    std::vector<std::string> stack(root->childrenIds.rbegin(), root->childrenIds.rend());
    while (!stack.empty() && out.size() <= nodes_.size()) {
        auto id = std::move(stack.back());
        stack.pop_back();
        if (const auto* node = getNode(id)) {
            stack.insert(stack.end(), node->childrenIds.rbegin(), node->childrenIds.rend());
        }
        out.push_back(std::move(id));
    }
    return out;
}

std::vector<const ChapterNode*> DocumentStructure::nodesAtLevel(int level) const {
    std::vector<const ChapterNode*> out;
    for (const auto& id : order_) {
        const auto& node = nodes_.at(id);
        if (node.level == level) {
            out.push_back(&node);
        }
    }
    return out;
}

int DocumentStructure::endPage(std::string_view nodeId, int lastPage) const {
    // A chapter ends on the page where the next node of the same or a higher
    // level starts, since both may share that page.
    auto it = std::find(order_.begin(), order_.end(), nodeId);
    if (it == order_.end()) {
        return lastPage;
    }
    const auto& node = nodes_.at(*it);
    for (auto next = std::next(it); next != order_.end(); ++next) {
        const auto& candidate = nodes_.at(*next);
        if (candidate.level <= node.level) {
            return std::max(node.pageNum, candidate.pageNum);
        }
    }
    return std::max(node.pageNum, lastPage);
}

std::vector<TocItem> DocumentStructure::toc(int lastPage) const {
    std::unordered_map<std::string, int> endPages;
    for (const auto& id : order_) {
        endPages[id] = endPage(id, lastPage);
    }

    std::vector<TocItem> items;
    items.reserve(rootIds_.size());
    for (const auto& id : rootIds_) {
        items.push_back(buildTocItem(nodes_.at(id), endPages));
    }
    return items;
}

TocItem DocumentStructure::buildTocItem(const ChapterNode& node,
                                        const std::unordered_map<std::string, int>& endPages) const {
    TocItem item;
    item.nodeId = node.nodeId;
    item.title = node.fullTitle();
    item.level = node.level;
    item.pageStart = node.pageNum;
    auto it = endPages.find(node.nodeId);
    item.pageEnd = it != endPages.end() ? it->second : node.pageNum;
    for (const auto& childId : node.childrenIds) {
        if (const auto* child = getNode(childId)) {
            item.children.push_back(buildTocItem(*child, endPages));
        }
    }
    return item;
}

void to_json(nlohmann::json& j, const DocumentStructure& s) {
    auto nodes = nlohmann::json::array();
    for (const auto& id : s.order_) {
        nodes.push_back(s.nodes_.at(id));
    }
    j = nlohmann::json{{"reg_id", s.regId_}, {"root_node_ids", s.rootIds_}, {"nodes", nodes}};
}

void from_json(const nlohmann::json& j, DocumentStructure& s) {
    s = DocumentStructure(j.at("reg_id").get<std::string>());
    // Nodes are stored in document order, so parents always precede children;
    // children lists are rebuilt by addNode.
    for (const auto& item : j.at("nodes")) {
        auto node = item.get<ChapterNode>();
        node.childrenIds.clear();
        auto added = s.addNode(std::move(node));
        if (!added) {
            throw std::invalid_argument(added.error().message);
        }
    }
}

} // namespace regdoc::structure
