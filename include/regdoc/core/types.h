#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace regdoc {

// Collection identifier, one per ingested document.
using RegId = std::string;

// Error types
enum class ErrorCode {
    Success = 0,
    ParserError,
    StorageError,
    RegulationNotFound,
    PageNotFound,
    InvalidPageRange,
    ChapterNotFound,
    AnnotationNotFound,
    TableNotFound,
    ReferenceResolutionFailed,
    IndexError,
    InvalidArgument,
    DatabaseError,
    CorruptedData,
    NotFound,
    NotSupported,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ParserError: return "Parser error";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::RegulationNotFound: return "Regulation not found";
        case ErrorCode::PageNotFound: return "Page not found";
        case ErrorCode::InvalidPageRange: return "Invalid page range";
        case ErrorCode::ChapterNotFound: return "Chapter not found";
        case ErrorCode::AnnotationNotFound: return "Annotation not found";
        case ErrorCode::TableNotFound: return "Table not found";
        case ErrorCode::ReferenceResolutionFailed: return "Reference resolution failed";
        case ErrorCode::IndexError: return "Index error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Structured context attached to an error. Fields are filled only where the
// failing operation knows them.
struct ErrorDetails {
    std::string regId;
    std::optional<int> pageNum;
    std::optional<std::pair<int, int>> pageRange;
    std::string target; // section number, table id, annotation id or reference text
    std::string reason;
};

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    ErrorDetails details;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, ErrorDetails d)
        : code(c), message(std::move(msg)), details(std::move(d)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace regdoc

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<regdoc::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(regdoc::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", regdoc::errorToString(error));
    }
};

namespace regdoc {

// Common constants
inline constexpr int DEFAULT_MAX_PAGES_PER_RANGE = 10;
inline constexpr int DEFAULT_RRF_K = 60;
inline constexpr size_t DEFAULT_EMBEDDING_DIM = 512;
inline constexpr size_t DEFAULT_MIN_EMBED_CHARS = 10;
inline constexpr size_t DEFAULT_SNIPPET_CHARS = 500;

} // namespace regdoc
