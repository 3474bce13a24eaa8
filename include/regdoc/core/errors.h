#pragma once

#include <regdoc/core/types.h>

#include <string>
#include <string_view>

namespace regdoc::errors {

// Factory helpers for the typed failures raised by the engine. Each one fills
// ErrorDetails so callers can react without parsing messages.

Error regulationNotFound(std::string_view regId);
Error pageNotFound(std::string_view regId, int pageNum);
Error invalidPageRange(int start, int end, std::string_view reason = {});
Error chapterNotFound(std::string_view regId, std::string_view sectionNumber);
Error annotationNotFound(std::string_view regId, std::string_view annotationId);
Error tableNotFound(std::string_view regId, std::string_view tableId);
Error referenceResolutionFailed(std::string_view regId, std::string_view referenceText,
                                std::string_view reason);
Error storageError(std::string message, std::string_view regId = {});
Error parserError(std::string message);
Error indexError(std::string message);
Error invalidArgument(std::string message);

} // namespace regdoc::errors
