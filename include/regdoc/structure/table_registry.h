#pragma once

#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace regdoc::structure {

/**
 * @brief Logical tables of one collection, with cross-page tables stitched
 *
 * All lookups go through maps built on insertion.
 */
class TableRegistry {
public:
    static constexpr const char* kVersion = "1.0";

    TableRegistry() = default;
    explicit TableRegistry(RegId regId) : regId_(std::move(regId)) {}

    const RegId& regId() const { return regId_; }

    void addTable(TableEntry entry);

    // Master table id or any segment id
    Result<TableEntry> getFullTable(std::string_view tableId) const;
    const TableEntry* find(std::string_view tableId) const;

    // Caption label such as 表6-2
    const TableEntry* findByCaption(std::string_view label) const;

    std::vector<const TableEntry*> getTablesOnPage(int pageNum) const;

    const std::unordered_map<int, std::vector<std::string>>& pageToTables() const {
        return pageToTables_;
    }
    const std::vector<std::string>& tableIds() const { return order_; }

    size_t size() const { return tables_.size(); }
    size_t crossPageCount() const;

    friend void to_json(nlohmann::json& j, const TableRegistry& r);
    friend void from_json(const nlohmann::json& j, TableRegistry& r);

private:
    RegId regId_;
    std::unordered_map<std::string, TableEntry> tables_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::string> segmentToTable_;
    std::unordered_map<int, std::vector<std::string>> pageToTables_;
    std::unordered_map<std::string, std::string> captionToTable_;
};

/**
 * @brief Second ingestion pass: groups table blocks into logical tables
 *
 * A table flagged is_truncated on a page that continues_to_next opens a chain.
 * The first table block of each following continues_from_prev page extends it
 * and gets master_table_id and segment_index stamped into its TableMeta.
 */
class TableRegistryBuilder {
public:
    Result<TableRegistry> build(std::vector<PageDocument>& pages) const;
};

} // namespace regdoc::structure
