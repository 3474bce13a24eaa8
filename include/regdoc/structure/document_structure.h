#pragma once

#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace regdoc::structure {

/**
 * @brief Chapter tree of one collection
 *
 * Nodes live in an arena keyed by node id and link to each other by id. The
 * tree is built once during ingestion and is read-only afterwards.
 */
class DocumentStructure {
public:
    DocumentStructure() = default;
    explicit DocumentStructure(RegId regId) : regId_(std::move(regId)) {}

    const RegId& regId() const { return regId_; }

    /**
     * @brief Insert a node and link it under its parent
     *
     * The parent must already exist. The first node with a given section
     * number owns that number in the lookup index.
     */
    Result<void> addNode(ChapterNode node);

    ChapterNode* mutableNode(std::string_view nodeId);
    const ChapterNode* getNode(std::string_view nodeId) const;
    const ChapterNode* getNodeBySectionNumber(std::string_view sectionNumber) const;

    // Full titles from the root down to nodeId (inclusive)
    std::vector<std::string> getChapterPath(std::string_view nodeId) const;

    // Descendants in pre-order, excluding nodeId itself
    std::vector<std::string> descendantIds(std::string_view nodeId) const;

    std::vector<const ChapterNode*> nodesAtLevel(int level) const;

    // Last page of a chapter: where the next node of the same or a higher level starts
    int endPage(std::string_view nodeId, int lastPage) const;

    // Nested table of contents; lastPage bounds the final chapter
    std::vector<TocItem> toc(int lastPage) const;

    const std::vector<std::string>& rootNodeIds() const { return rootIds_; }
    // Node ids in document order
    const std::vector<std::string>& nodeOrder() const { return order_; }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    friend void to_json(nlohmann::json& j, const DocumentStructure& s);
    friend void from_json(const nlohmann::json& j, DocumentStructure& s);

private:
    TocItem buildTocItem(const ChapterNode& node,
                         const std::unordered_map<std::string, int>& endPages) const;

    RegId regId_;
    std::unordered_map<std::string, ChapterNode> nodes_;
    std::vector<std::string> order_;
    std::vector<std::string> rootIds_;
    std::unordered_map<std::string, std::string> bySection_;
};

} // namespace regdoc::structure
