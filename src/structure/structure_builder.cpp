#include <regdoc/core/errors.h>
#include <regdoc/structure/structure_builder.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <optional>
#include <unordered_set>

namespace regdoc::structure {

namespace {

struct OpenNode {
    int level;
    std::string nodeId;
    std::string fullTitle;
};

std::vector<std::string> pathOf(const std::vector<OpenNode>& stack) {
    std::vector<std::string> path;
    path.reserve(stack.size());
    for (const auto& entry : stack) {
        path.push_back(entry.fullTitle);
    }
    return path;
}

std::string uniqueBlockId(std::unordered_set<std::string>& used, const std::string& base) {
    std::string candidate = base;
    for (int n = 2; used.count(candidate) > 0; ++n) {
        candidate = fmt::format("{}_{}", base, n);
    }
    used.insert(candidate);
    return candidate;
}

} // namespace

DocumentStructureBuilder::DocumentStructureBuilder(StructureConfig config)
    : config_(config), parser_(config) {}

Result<void> DocumentStructureBuilder::validate(const std::vector<PageDocument>& pages) const {
    if (pages.empty()) {
        return errors::parserError("No pages to build a structure from");
    }
    const auto& regId = pages.front().regId;
    if (regId.empty()) {
        return errors::parserError("Pages carry an empty reg_id");
    }

    std::unordered_set<std::string> blockIds;
    for (size_t i = 0; i < pages.size(); ++i) {
        const auto& page = pages[i];
        if (page.regId != regId) {
            return errors::parserError(fmt::format(
                "Page {} belongs to '{}', expected '{}'", page.pageNum, page.regId, regId));
        }
        if (page.pageNum != static_cast<int>(i) + 1) {
            return errors::parserError(fmt::format(
                "Pages must be numbered contiguously from 1: found {} at position {}",
                page.pageNum, i + 1));
        }
        for (const auto& block : page.contentBlocks) {
            if (block.blockId.empty()) {
                return errors::parserError(
                    fmt::format("Block without id on page {}", page.pageNum));
            }
            if (!blockIds.insert(block.blockId).second) {
                return errors::parserError(fmt::format("Duplicate block id '{}' on page {}",
                                                       block.blockId, page.pageNum));
            }
        }
    }
    return {};
}

Result<DocumentStructure> DocumentStructureBuilder::build(std::vector<PageDocument>& pages) const {
    if (auto valid = validate(pages); !valid) {
        spdlog::error("Structure build rejected input: {}", valid.error().message);
        return valid.error();
    }

    DocumentStructure structure(pages.front().regId);
    std::unordered_set<std::string> usedIds;
    for (const auto& page : pages) {
        for (const auto& block : page.contentBlocks) {
            usedIds.insert(block.blockId);
        }
    }

    std::vector<OpenNode> stack;
    size_t nodeCounter = 0;
    size_t splitCount = 0;

    for (auto& page : pages) {
        std::vector<ContentBlock> blocks;
        blocks.reserve(page.contentBlocks.size() + 2);

        std::optional<std::vector<std::string>> pagePath;
        if (!stack.empty()) {
            pagePath = pathOf(stack);
        }

        for (auto& block : page.contentBlocks) {
            std::optional<HeadingMatch> heading;
            if (block.blockType == BlockType::Text || block.blockType == BlockType::Heading) {
                heading = parser_.parse(block.content);
                // A bare "3 ..." inside body text is far more often a list item
                if (heading && heading->kind == HeadingKind::Numeric && heading->components == 1 &&
                    block.blockType != BlockType::Heading) {
                    heading.reset();
                }
            }

            if (!heading) {
                if (!stack.empty()) {
                    block.chapterNodeId = stack.back().nodeId;
                    block.chapterPath = pathOf(stack);
                    structure.mutableNode(stack.back().nodeId)
                        ->contentBlockIds.push_back(block.blockId);
                }
                blocks.push_back(std::move(block));
                continue;
            }

            while (!stack.empty() && stack.back().level >= heading->level) {
                stack.pop_back();
            }

            auto split = parser_.splitTitle(heading->text);

            ChapterNode node;
            node.nodeId = fmt::format("ch_{:04d}", ++nodeCounter);
            node.sectionNumber = heading->sectionNumber;
            node.title = split.title;
            node.level = heading->level;
            node.pageNum = page.pageNum;
            if (!stack.empty()) {
                node.parentId = stack.back().nodeId;
            }
            node.contentBlockIds.push_back(block.blockId);

            std::optional<ContentBlock> sectionBlock;
            if (!split.directContent.empty()) {
                node.hasDirectContent = true;
                node.directContent = split.directContent;

                ContentBlock content;
                content.blockId = uniqueBlockId(usedIds, block.blockId + "_content");
                content.blockType = BlockType::SectionContent;
                content.content = split.directContent;
                content.chapterNodeId = node.nodeId;
                node.contentBlockIds.push_back(content.blockId);
                sectionBlock = std::move(content);
                ++splitCount;
            }

            const auto nodeId = node.nodeId;
            const auto fullTitle = node.fullTitle();
            const int level = node.level;
            if (auto added = structure.addNode(std::move(node)); !added) {
                return added.error();
            }
            stack.push_back(OpenNode{level, nodeId, fullTitle});

            auto path = pathOf(stack);
            if (!pagePath) {
                pagePath = path;
            }

            block.blockType = BlockType::Heading;
            block.headingLevel = level;
            block.content = fullTitle;
            block.chapterNodeId = nodeId;
            block.chapterPath = path;
            blocks.push_back(std::move(block));

            if (sectionBlock) {
                sectionBlock->chapterPath = std::move(path);
                blocks.push_back(std::move(*sectionBlock));
            }

            spdlog::debug("Chapter {} '{}' level {} on page {}", nodeId, fullTitle, level,
                          page.pageNum);
        }

        for (size_t i = 0; i < blocks.size(); ++i) {
            blocks[i].orderInPage = static_cast<int>(i);
        }
        page.contentBlocks = std::move(blocks);
        page.chapterPath = pagePath.value_or(std::vector<std::string>{});
    }

    spdlog::info("Built chapter structure for {}: {} nodes, {} roots, {} headings split",
                 structure.regId(), structure.size(), structure.rootNodeIds().size(), splitCount);
    return structure;
}

} // namespace regdoc::structure
