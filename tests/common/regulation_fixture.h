#pragma once

#include <regdoc/search/search_index.h>
#include <regdoc/storage/models.h>

#include <optional>
#include <string>
#include <vector>

namespace regdoc::test {

inline ContentBlock makeBlock(std::string blockId, std::string content,
                              BlockType type = BlockType::Text) {
    ContentBlock block;
    block.blockId = std::move(blockId);
    block.blockType = type;
    block.content = std::move(content);
    return block;
}

inline ContentBlock makeTable(std::string blockId, std::string content, std::string tableId,
                              std::string caption, bool truncated) {
    ContentBlock block = makeBlock(std::move(blockId), std::move(content), BlockType::Table);
    TableMeta meta;
    meta.tableId = std::move(tableId);
    meta.caption = std::move(caption);
    meta.isTruncated = truncated;
    block.tableMeta = std::move(meta);
    return block;
}

inline PageDocument makePage(const RegId& regId, int pageNum, std::vector<ContentBlock> blocks) {
    PageDocument page;
    page.regId = regId;
    page.pageNum = pageNum;
    page.contentBlocks = std::move(blocks);
    for (size_t i = 0; i < page.contentBlocks.size(); ++i) {
        page.contentBlocks[i].orderInPage = static_cast<int>(i);
    }
    return page;
}

inline search::BlockRecord makeRecord(const RegId& regId, int pageNum, std::string blockId,
                                     std::string content, std::vector<std::string> chapterPath = {},
                                     std::optional<std::string> sectionNumber = std::nullopt,
                                     BlockType type = BlockType::Text) {
    search::BlockRecord record;
    record.regId = regId;
    record.pageNum = pageNum;
    record.block = makeBlock(std::move(blockId), std::move(content), type);
    record.block.chapterPath = chapterPath;
    record.chapterPath = std::move(chapterPath);
    record.sectionNumber = std::move(sectionNumber);
    return record;
}

/**
 * Four-page fire code:
 *
 *   P1  第一章 总则 / 1.1 目的
 *   P2  1.2 适用范围, 表1-1 starts (truncated)
 *   P3  表1-1 continues, 第二章 消防设计 / 2.1 防火分区, annotation 注①
 *   P4  2.1.1 一般规定, 第三章 附则
 */
inline std::vector<PageDocument> sampleRegulation(const RegId& regId = "fire_code") {
    std::vector<PageDocument> pages;

    pages.push_back(makePage(regId, 1,
                             {makeBlock("b1", "第一章 总则", BlockType::Heading),
                              makeBlock("b2", "1.1 目的"),
                              makeBlock("b3", "本标准规定了建筑防火设计的基本要求。")}));

    auto page2 = makePage(
        regId, 2,
        {makeBlock("b4", "1.2 适用范围"),
         makeBlock("b5", "本标准适用于新建、扩建和改建的民用建筑。"),
         makeTable("b6",
                   "表1-1 建筑分类\n| 类别 | 高度 |\n| --- | --- |\n| 住宅 | 27m |\n| 公建 | 24m |",
                   "t1", "表1-1 建筑分类", true)});
    page2.continuesToNext = true;
    pages.push_back(std::move(page2));

    auto page3 = makePage(regId, 3,
                          {makeTable("b7", "| 厂房 | 24m |\n| 仓库 | 24m |", "t1_p3", "", false),
                           makeBlock("b8", "第二章 消防设计", BlockType::Heading),
                           makeBlock("b9", "2.1 防火分区"),
                           makeBlock("b10", "防火分区的最大允许建筑面积应符合表1-1的规定。")});
    page3.continuesFromPrev = true;
    Annotation note;
    note.annotationId = "注①";
    note.content = "注①：建筑高度按室外设计地面至屋面面层计算。";
    page3.annotations.push_back(note);
    pages.push_back(std::move(page3));

    pages.push_back(
        makePage(regId, 4,
                 {makeBlock("b11", "2.1.1 一般规定"),
                  makeBlock("b12", "高层建筑每个防火分区的最大允许建筑面积为1500平方米。"),
                  makeBlock("b13", "第三章 附则", BlockType::Heading),
                  makeBlock("b14", "本规范自发布之日起实施。")}));
    return pages;
}

} // namespace regdoc::test
