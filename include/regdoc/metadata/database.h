#pragma once

#include <regdoc/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 *
 * Connections are opened in serialized (full mutex) mode. Callers still guard
 * multi-statement sequences themselves.
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction, rolling back when func fails or throws
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                rollbackQuietly();
                return result;
            }
            return commit();
        } catch (...) {
            rollbackQuietly();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Check if FTS5 is compiled into the linked SQLite
     */
    Result<bool> hasFTS5();

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    // Rollback after a failure; a rollback error is logged, the original error wins.
    void rollbackQuietly();

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace regdoc::metadata
