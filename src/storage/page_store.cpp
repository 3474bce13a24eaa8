#include <regdoc/core/errors.h>
#include <regdoc/storage/markdown_table.h>
#include <regdoc/storage/page_store.h>
#include <regdoc/structure/structure_builder.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace regdoc::storage {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr size_t TEMP_NAME_LENGTH = 16;
constexpr size_t MUTEX_POOL_SIZE = 64;
constexpr const char* INFO_FILE = "info.json";
constexpr const char* STRUCTURE_FILE = "structure.json";
constexpr const char* REGISTRY_FILE = "table_registry.json";

std::string pageFileName(int pageNum) {
    return fmt::format("page_{:04d}.json", pageNum);
}

// page_0012.json -> 12
std::optional<int> pageNumFromFileName(const std::string& name) {
    if (name.size() < 10 || name.rfind("page_", 0) != 0 || !name.ends_with(".json")) {
        return std::nullopt;
    }
    auto digits = name.substr(5, name.size() - 10);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

} // namespace

Result<void> validateRegId(std::string_view regId) {
    if (regId.empty() || regId.size() > 200) {
        return errors::invalidArgument(fmt::format("Invalid reg_id '{}'", regId));
    }
    if (regId.front() == '.' ||
        regId.find_first_of(std::string_view("/\\:\0", 4)) != std::string_view::npos) {
        return errors::invalidArgument(
            fmt::format("reg_id '{}' is not a single path component", regId));
    }
    return {};
}

struct PageStore::Impl {
    PageStoreConfig config;

    // Per-collection write serialisation
    struct MutexPool {
        std::vector<std::unique_ptr<std::mutex>> mutexes;

        explicit MutexPool(size_t size) {
            mutexes.reserve(size);
            for (size_t i = 0; i < size; ++i) {
                mutexes.emplace_back(std::make_unique<std::mutex>());
            }
        }

        std::mutex& getMutex(std::string_view regId) {
            auto index = std::hash<std::string_view>{}(regId) % mutexes.size();
            return *mutexes[index];
        }
    } writeMutexPool;

    explicit Impl(PageStoreConfig cfg) : config(std::move(cfg)), writeMutexPool(MUTEX_POOL_SIZE) {
        if (config.maxPagesPerRange < 1) {
            throw std::invalid_argument("maxPagesPerRange must be at least 1");
        }
        std::error_code ec;
        fs::create_directories(config.basePath / ".tmp", ec);
        if (ec) {
            throw std::runtime_error(
                fmt::format("Failed to create page store directory: {}", ec.message()));
        }
    }

    fs::path collectionDir(std::string_view regId) const {
        return config.basePath / std::string(regId);
    }

    fs::path tempPath() const {
        static thread_local std::random_device rd;
        static thread_local std::mt19937 gen(rd());
        static thread_local std::uniform_int_distribution<> dis(0, 15);

        std::string tempName;
        tempName.reserve(TEMP_NAME_LENGTH);
        for (size_t i = 0; i < TEMP_NAME_LENGTH; ++i) {
            tempName += fmt::format("{:x}", dis(gen));
        }
        return config.basePath / ".tmp" / tempName;
    }

    bool collectionExists(std::string_view regId) const {
        std::error_code ec;
        return fs::is_directory(collectionDir(regId), ec);
    }

    Result<void> atomicWrite(const fs::path& path, const json& document,
                             std::string_view regId) const {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory {}: {}", path.parent_path().string(),
                          ec.message());
            return errors::storageError(
                fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message()),
                regId);
        }

        std::string payload;
        try {
            payload = document.dump(2);
        } catch (const json::exception& e) {
            return errors::storageError(
                fmt::format("Cannot serialise {}: {}", path.filename().string(), e.what()), regId);
        }

        auto temp = tempPath();
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                spdlog::error("Failed to create temp file: {}", temp.string());
                return errors::storageError("Failed to create temp file " + temp.string(), regId);
            }
            file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            if (!file) {
                file.close();
                fs::remove(temp, ec);
                return errors::storageError("Failed to write " + temp.string(), regId);
            }
        }

        fs::rename(temp, path, ec);
        if (ec) {
            std::error_code cleanup;
            fs::remove(temp, cleanup);
            spdlog::error("Failed to rename {} to {}: {}", temp.string(), path.string(),
                          ec.message());
            return errors::storageError(
                fmt::format("Failed to move {} into place: {}", path.string(), ec.message()),
                regId);
        }
        return {};
    }

    Result<json> readJson(const fs::path& path, std::string_view regId) const {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Error{ErrorCode::NotFound, "Missing " + path.string()};
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            return json::parse(buffer.str());
        } catch (const json::exception& e) {
            spdlog::error("Corrupted JSON in {}: {}", path.string(), e.what());
            ErrorDetails d;
            d.regId = std::string(regId);
            d.reason = e.what();
            return Error{ErrorCode::CorruptedData, "Corrupted " + path.string(), std::move(d)};
        }
    }

    template <typename T>
    Result<T> readModel(const fs::path& path, std::string_view regId) const {
        auto doc = readJson(path, regId);
        if (!doc) {
            return doc.error();
        }
        try {
            return doc.value().template get<T>();
        } catch (const std::exception& e) {
            spdlog::error("Malformed record in {}: {}", path.string(), e.what());
            ErrorDetails d;
            d.regId = std::string(regId);
            d.reason = e.what();
            return Error{ErrorCode::CorruptedData, "Malformed " + path.string(), std::move(d)};
        }
    }

    std::vector<int> storedPageNumbers(std::string_view regId) const {
        std::vector<int> nums;
        std::error_code ec;
        for (fs::directory_iterator it(collectionDir(regId), ec), end; !ec && it != end;
             it.increment(ec)) {
            if (auto num = pageNumFromFileName(it->path().filename().string())) {
                nums.push_back(*num);
            }
        }
        std::sort(nums.begin(), nums.end());
        return nums;
    }

    bool hasArtifact(std::string_view regId, const char* file) const {
        std::error_code ec;
        return fs::exists(collectionDir(regId) / file, ec);
    }

    Result<std::vector<PageDocument>> loadStoredPages(std::string_view regId) const {
        auto nums = storedPageNumbers(regId);
        if (nums.empty()) {
            return errors::regulationNotFound(regId);
        }
        std::vector<PageDocument> pages;
        pages.reserve(nums.size());
        for (int num : nums) {
            auto page = readModel<PageDocument>(collectionDir(regId) / pageFileName(num), regId);
            if (!page) {
                return page.error();
            }
            pages.push_back(std::move(page).value());
        }
        return pages;
    }

    // Info record for a collection that only has page files
    Result<RegulationInfo> deriveInfo(std::string_view regId) const {
        auto nums = storedPageNumbers(regId);
        if (nums.empty()) {
            return errors::regulationNotFound(regId);
        }
        RegulationInfo info;
        info.regId = std::string(regId);
        info.title = std::string(regId);
        info.totalPages = nums.back();
        return info;
    }

    Result<void> writePage(const PageDocument& page) const {
        return atomicWrite(collectionDir(page.regId) / pageFileName(page.pageNum), json(page),
                           page.regId);
    }
};

PageStore::PageStore(PageStoreConfig config) : pImpl(std::make_unique<Impl>(std::move(config))) {
    spdlog::debug("Initialized page store at: {}", pImpl->config.basePath.string());
}

PageStore::~PageStore() = default;

PageStore::PageStore(PageStore&&) noexcept = default;
PageStore& PageStore::operator=(PageStore&&) noexcept = default;

fs::path PageStore::basePath() const {
    return pImpl->config.basePath;
}

int PageStore::maxPagesPerRange() const {
    return pImpl->config.maxPagesPerRange;
}

Result<void> PageStore::savePage(const PageDocument& page) {
    if (auto valid = validateRegId(page.regId); !valid) {
        return valid;
    }
    if (page.pageNum < 1) {
        return errors::invalidArgument(fmt::format("Invalid page number {}", page.pageNum));
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(page.regId));
    auto result = pImpl->writePage(page);
    if (result) {
        spdlog::debug("Stored page {} of {}", page.pageNum, page.regId);
    }
    return result;
}

Result<RegulationInfo> PageStore::saveCollection(const std::vector<PageDocument>& pages,
                                                 const structure::DocumentStructure& structure,
                                                 const structure::TableRegistry& registry,
                                                 std::string_view title,
                                                 std::string_view sourceFile) {
    if (pages.empty()) {
        return errors::storageError("Cannot save a collection without pages");
    }
    const auto& regId = pages.front().regId;
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }

    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(regId));

    std::set<int> saved;
    for (const auto& page : pages) {
        if (page.regId != regId) {
            return errors::storageError(
                fmt::format("Page {} belongs to '{}', not '{}'", page.pageNum, page.regId, regId),
                regId);
        }
        if (auto r = pImpl->writePage(page); !r) {
            return r.error();
        }
        saved.insert(page.pageNum);
    }

    // Drop pages of an earlier ingestion that the new page stream no longer has
    std::error_code ec;
    for (fs::directory_iterator it(pImpl->collectionDir(regId), ec), end; !ec && it != end;
         it.increment(ec)) {
        auto num = pageNumFromFileName(it->path().filename().string());
        if (num && saved.count(*num) == 0) {
            std::error_code rmEc;
            fs::remove(it->path(), rmEc);
            if (rmEc) {
                spdlog::warn("Could not remove stale page {}: {}", it->path().string(),
                             rmEc.message());
            }
        }
    }

    if (auto r = pImpl->atomicWrite(pImpl->collectionDir(regId) / STRUCTURE_FILE, json(structure),
                                    regId);
        !r) {
        return r.error();
    }
    if (auto r = pImpl->atomicWrite(pImpl->collectionDir(regId) / REGISTRY_FILE, json(registry),
                                    regId);
        !r) {
        return r.error();
    }

    RegulationInfo info;
    info.regId = regId;
    info.title = std::string(title);
    info.sourceFile = std::string(sourceFile);
    info.totalPages = static_cast<int>(pages.size());
    info.indexedAt = currentIsoTimestamp();
    if (auto r = pImpl->atomicWrite(pImpl->collectionDir(regId) / INFO_FILE, json(info), regId);
        !r) {
        return r.error();
    }

    spdlog::info("Saved collection {}: {} pages, {} chapters, {} tables", regId, pages.size(),
                 structure.size(), registry.size());
    return info;
}

Result<PageDocument> PageStore::loadPage(std::string_view regId, int pageNum) const {
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    auto path = pImpl->collectionDir(regId) / pageFileName(pageNum);
    std::error_code ec;
    if (pageNum < 1 || !fs::exists(path, ec)) {
        return errors::pageNotFound(regId, pageNum);
    }
    auto page = pImpl->readModel<PageDocument>(path, regId);
    if (!page && page.error().code == ErrorCode::NotFound) {
        // Deleted between the existence check and the read
        return errors::pageNotFound(regId, pageNum);
    }
    return page;
}

Result<PageContent> PageStore::loadPageRange(std::string_view regId, int startPage,
                                             int endPage) const {
    if (startPage < 1) {
        return errors::invalidPageRange(startPage, endPage, "start page must be at least 1");
    }
    if (startPage > endPage) {
        return errors::invalidPageRange(startPage, endPage, "start page is after end page");
    }
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }

    PageContent content;
    content.regId = std::string(regId);
    content.startPage = startPage;
    content.endPage = endPage;
    const int maxPages = pImpl->config.maxPagesPerRange;
    if (endPage - startPage + 1 > maxPages) {
        content.endPage = startPage + maxPages - 1;
        content.truncated = true;
        spdlog::debug("Range {}-{} of {} capped at {} pages", startPage, endPage, regId, maxPages);
    }

    for (int p = content.startPage; p <= content.endPage; ++p) {
        auto page = loadPage(regId, p);
        if (page) {
            content.pages.push_back(std::move(page).value());
            continue;
        }
        if (page.error().code == ErrorCode::PageNotFound) {
            spdlog::warn("Page {} of {} missing, skipped in range {}-{}", p, regId,
                         content.startPage, content.endPage);
            content.skippedPages.push_back(p);
            continue;
        }
        return page.error();
    }

    if (content.pages.empty()) {
        return errors::pageNotFound(regId, startPage);
    }

    content.contentMarkdown = mergePages(content.pages, content.hasMergedTables);
    content.continuesToNext = content.pages.back().continuesToNext;
    return content;
}

std::string PageStore::mergePages(const std::vector<PageDocument>& pages, bool& hasMergedTables) {
    hasMergedTables = false;
    std::vector<std::string> parts;
    std::optional<markdown::MarkdownTable> pending;
    size_t pendingSlot = 0;
    int pendingLastPage = 0;

    auto flush = [&]() {
        if (pending) {
            parts[pendingSlot] = pending->render();
            pending.reset();
        }
    };

    for (const auto& page : pages) {
        if (pending && !(page.continuesFromPrev && page.pageNum == pendingLastPage + 1)) {
            flush();
        }
        parts.push_back(fmt::format("<!-- Page {} -->", page.pageNum));

        const ContentBlock* truncated = page.truncatedTable();
        bool firstTableSeen = false;
        bool keepOpen = false;

        for (const auto& block : page.contentBlocks) {
            if (block.blockType == BlockType::Table) {
                const bool isTruncated = &block == truncated;
                if (pending && !firstTableSeen) {
                    firstTableSeen = true;
                    pending->append(markdown::parseTable(block.content));
                    pendingLastPage = page.pageNum;
                    hasMergedTables = true;
                    if (isTruncated) {
                        keepOpen = true;
                    } else {
                        flush();
                    }
                    continue;
                }
                firstTableSeen = true;
                if (isTruncated) {
                    flush();
                    pending = markdown::parseTable(block.content);
                    parts.emplace_back();
                    pendingSlot = parts.size() - 1;
                    pendingLastPage = page.pageNum;
                    keepOpen = true;
                    continue;
                }
            }
            if (!block.content.empty()) {
                parts.push_back(block.content);
            }
        }

        if (pending && !keepOpen) {
            flush();
        }
    }
    flush();

    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += "\n\n";
        }
        out += part;
    }
    return out;
}

Result<std::vector<RegulationInfo>> PageStore::listCollections() const {
    std::vector<RegulationInfo> out;
    std::error_code ec;
    for (fs::directory_iterator it(pImpl->config.basePath, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (!validateRegId(name)) {
            continue;
        }
        if (!pImpl->hasArtifact(name, INFO_FILE) && pImpl->storedPageNumbers(name).empty()) {
            continue;
        }
        auto info = loadInfo(name);
        if (!info) {
            spdlog::warn("Skipping collection {}: {}", name, info.error().message);
            continue;
        }
        out.push_back(std::move(info).value());
    }
    if (ec) {
        return errors::storageError(
            fmt::format("Cannot list {}: {}", pImpl->config.basePath.string(), ec.message()));
    }
    std::sort(out.begin(), out.end(),
              [](const RegulationInfo& a, const RegulationInfo& b) { return a.regId < b.regId; });
    return out;
}

Result<void> PageStore::deleteCollection(std::string_view regId) {
    if (auto valid = validateRegId(regId); !valid) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(regId));
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    std::error_code ec;
    auto removed = fs::remove_all(pImpl->collectionDir(regId), ec);
    if (ec) {
        spdlog::error("Failed to delete collection {}: {}", regId, ec.message());
        return errors::storageError(
            fmt::format("Failed to delete collection {}: {}", regId, ec.message()), regId);
    }
    spdlog::info("Deleted collection {} ({} entries)", regId, removed);
    return {};
}

bool PageStore::exists(std::string_view regId) const {
    return validateRegId(regId) && pImpl->collectionExists(regId);
}

Result<RegulationInfo> PageStore::loadInfo(std::string_view regId) const {
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    if (!pImpl->hasArtifact(regId, INFO_FILE)) {
        return pImpl->deriveInfo(regId);
    }
    return pImpl->readModel<RegulationInfo>(pImpl->collectionDir(regId) / INFO_FILE, regId);
}

Result<std::vector<int>> PageStore::pageNumbers(std::string_view regId) const {
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    return pImpl->storedPageNumbers(regId);
}

Result<void> PageStore::saveDocumentStructure(const structure::DocumentStructure& structure) {
    if (auto valid = validateRegId(structure.regId()); !valid) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(structure.regId()));
    return pImpl->atomicWrite(pImpl->collectionDir(structure.regId()) / STRUCTURE_FILE,
                              json(structure), structure.regId());
}

Result<structure::DocumentStructure> PageStore::loadDocumentStructure(std::string_view regId) const {
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    if (!pImpl->hasArtifact(regId, STRUCTURE_FILE)) {
        auto pages = pImpl->loadStoredPages(regId);
        if (!pages) {
            return pages.error();
        }
        spdlog::debug("No {} for {}, building from {} stored pages", STRUCTURE_FILE, regId,
                      pages.value().size());
        return structure::DocumentStructureBuilder{}.build(pages.value());
    }
    return pImpl->readModel<structure::DocumentStructure>(
        pImpl->collectionDir(regId) / STRUCTURE_FILE, regId);
}

Result<void> PageStore::saveTableRegistry(const structure::TableRegistry& registry) {
    if (auto valid = validateRegId(registry.regId()); !valid) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(registry.regId()));
    return pImpl->atomicWrite(pImpl->collectionDir(registry.regId()) / REGISTRY_FILE,
                              json(registry), registry.regId());
}

Result<structure::TableRegistry> PageStore::loadTableRegistry(std::string_view regId) const {
    if (auto valid = validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!pImpl->collectionExists(regId)) {
        return errors::regulationNotFound(regId);
    }
    if (!pImpl->hasArtifact(regId, REGISTRY_FILE)) {
        auto pages = pImpl->loadStoredPages(regId);
        if (!pages) {
            return pages.error();
        }
        spdlog::debug("No {} for {}, building from {} stored pages", REGISTRY_FILE, regId,
                      pages.value().size());
        // Chapter paths on the entries come from the structure pass
        if (auto tree = structure::DocumentStructureBuilder{}.build(pages.value()); !tree) {
            spdlog::warn("Tables of {} carry no chapter paths: {}", regId, tree.error().message);
        }
        return structure::TableRegistryBuilder{}.build(pages.value());
    }
    return pImpl->readModel<structure::TableRegistry>(pImpl->collectionDir(regId) / REGISTRY_FILE,
                                                      regId);
}

} // namespace regdoc::storage
