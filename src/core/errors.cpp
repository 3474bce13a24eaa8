#include <regdoc/core/errors.h>

#include <fmt/format.h>

namespace regdoc::errors {

Error regulationNotFound(std::string_view regId) {
    ErrorDetails d;
    d.regId = std::string(regId);
    return Error{ErrorCode::RegulationNotFound, fmt::format("Regulation not found: {}", regId),
                 std::move(d)};
}

Error pageNotFound(std::string_view regId, int pageNum) {
    ErrorDetails d;
    d.regId = std::string(regId);
    d.pageNum = pageNum;
    return Error{ErrorCode::PageNotFound,
                 fmt::format("Page {} not found in regulation {}", pageNum, regId), std::move(d)};
}

Error invalidPageRange(int start, int end, std::string_view reason) {
    ErrorDetails d;
    d.pageRange = std::make_pair(start, end);
    d.reason = std::string(reason);
    if (reason.empty()) {
        return Error{ErrorCode::InvalidPageRange,
                     fmt::format("Invalid page range: {}-{}", start, end), std::move(d)};
    }
    return Error{ErrorCode::InvalidPageRange,
                 fmt::format("Invalid page range: {}-{} ({})", start, end, reason), std::move(d)};
}

Error chapterNotFound(std::string_view regId, std::string_view sectionNumber) {
    ErrorDetails d;
    d.regId = std::string(regId);
    d.target = std::string(sectionNumber);
    return Error{ErrorCode::ChapterNotFound,
                 fmt::format("Chapter '{}' not found in regulation {}", sectionNumber, regId),
                 std::move(d)};
}

Error annotationNotFound(std::string_view regId, std::string_view annotationId) {
    ErrorDetails d;
    d.regId = std::string(regId);
    d.target = std::string(annotationId);
    return Error{ErrorCode::AnnotationNotFound,
                 fmt::format("Annotation '{}' not found in regulation {}", annotationId, regId),
                 std::move(d)};
}

Error tableNotFound(std::string_view regId, std::string_view tableId) {
    ErrorDetails d;
    d.regId = std::string(regId);
    d.target = std::string(tableId);
    return Error{ErrorCode::TableNotFound,
                 fmt::format("Table '{}' not found in regulation {}", tableId, regId),
                 std::move(d)};
}

Error referenceResolutionFailed(std::string_view regId, std::string_view referenceText,
                                std::string_view reason) {
    ErrorDetails d;
    d.regId = std::string(regId);
    d.target = std::string(referenceText);
    d.reason = std::string(reason);
    return Error{ErrorCode::ReferenceResolutionFailed,
                 fmt::format("Cannot resolve reference '{}': {}", referenceText, reason),
                 std::move(d)};
}

Error storageError(std::string message, std::string_view regId) {
    ErrorDetails d;
    d.regId = std::string(regId);
    return Error{ErrorCode::StorageError, std::move(message), std::move(d)};
}

Error parserError(std::string message) {
    return Error{ErrorCode::ParserError, std::move(message)};
}

Error indexError(std::string message) {
    return Error{ErrorCode::IndexError, std::move(message)};
}

Error invalidArgument(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

} // namespace regdoc::errors
