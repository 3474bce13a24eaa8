#pragma once

#include <regdoc/metadata/database.h>
#include <regdoc/search/search_index.h>

#include <string>
#include <string_view>
#include <vector>

namespace regdoc::search::detail {

// SQL fragment (" AND ..." terms) plus its positional parameters, in order
struct FilterClause {
    std::string sql;
    std::vector<std::string> params;
};

inline std::string escapeLike(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '%' || c == '_' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// Columns expected on alias: reg_id, chapter_path, block_type, section_number
inline FilterClause buildBlockFilters(const SearchQuery& query, std::string_view alias) {
    const std::string a(alias);
    FilterClause clause;

    if (query.regId) {
        clause.sql += " AND " + a + ".reg_id = ?";
        clause.params.push_back(*query.regId);
    }
    if (query.chapterScope && !query.chapterScope->empty()) {
        clause.sql += " AND " + a + ".chapter_path LIKE ? ESCAPE '\\'";
        clause.params.push_back("%" + escapeLike(*query.chapterScope) + "%");
    }
    if (!query.blockTypes.empty()) {
        clause.sql += " AND " + a + ".block_type IN (";
        for (size_t i = 0; i < query.blockTypes.size(); ++i) {
            clause.sql += i == 0 ? "?" : ", ?";
            clause.params.emplace_back(toString(query.blockTypes[i]));
        }
        clause.sql += ")";
    }
    if (query.sectionNumber && !query.sectionNumber->empty()) {
        clause.sql += " AND (" + a + ".section_number = ? OR " + a +
                      ".section_number LIKE ? ESCAPE '\\')";
        clause.params.push_back(*query.sectionNumber);
        clause.params.push_back(escapeLike(*query.sectionNumber) + ".%");
    }
    return clause;
}

// Bind clause parameters starting at index; returns the next free index
inline Result<int> bindFilters(metadata::Statement& stmt, const FilterClause& clause, int index) {
    for (const auto& param : clause.params) {
        if (auto r = stmt.bind(index++, param); !r) {
            return r.error();
        }
    }
    return index;
}

} // namespace regdoc::search::detail
