#pragma once

#include <regdoc/metadata/database.h>
#include <regdoc/storage/models.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace regdoc::search::detail {

// Writers queue behind one another instead of failing with SQLITE_BUSY
constexpr std::chrono::milliseconds kBusyTimeout{5000};

// Open an index database; an empty path gives a private in-memory database
inline Result<void> openIndexDatabase(metadata::Database& db, const std::filesystem::path& path) {
    if (path.empty()) {
        return db.open(":memory:", metadata::ConnectionMode::Memory);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::StorageError, "Failed to create index directory " +
                                                      path.parent_path().string() + ": " +
                                                      ec.message()};
        }
    }
    if (auto r = db.open(path.string(), metadata::ConnectionMode::Create); !r) {
        return r;
    }
    if (auto r = db.setBusyTimeout(kBusyTimeout); !r) {
        return r;
    }
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("Could not enable WAL on {}: {}", path.string(), r.error().message);
    }
    return Result<void>();
}

inline std::string chapterPathToJson(const std::vector<std::string>& path) {
    return nlohmann::json(path).dump();
}

inline Result<std::vector<std::string>> chapterPathFromJson(const std::string& stored) {
    try {
        return nlohmann::json::parse(stored).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::CorruptedData,
                     std::string("Stored chapter path is not valid JSON: ") + e.what()};
    }
}

} // namespace regdoc::search::detail
