#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>
#include <regdoc/structure/document_structure.h>
#include <regdoc/structure/heading_parser.h>

#include <vector>

namespace regdoc::structure {

/**
 * @brief Builds the chapter tree from an ordered page stream
 *
 * One forward pass. Heading blocks open nodes; every following block is
 * attached to the most recently opened node, across page boundaries. The
 * pages are updated in place: chapter node ids, chapter paths, heading
 * levels and the split-off section_content blocks.
 */
class DocumentStructureBuilder {
public:
    explicit DocumentStructureBuilder(StructureConfig config = {});

    /**
     * @brief Build the structure for one collection
     *
     * @return ParserError when pages are empty, belong to different
     *         collections, are not numbered 1..N, or reuse a block id
     */
    Result<DocumentStructure> build(std::vector<PageDocument>& pages) const;

private:
    Result<void> validate(const std::vector<PageDocument>& pages) const;

    StructureConfig config_;
    HeadingParser parser_;
};

} // namespace regdoc::structure
