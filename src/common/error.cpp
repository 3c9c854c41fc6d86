// =============================================================================
// bamseek - Error Handling Framework Implementation
// =============================================================================

#include "bamseek/common/error.h"

#include <sstream>

namespace bamseek {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (blockAddress.has_value()) {
        separate();
        oss << "block: " << *blockAddress;
    }

    if (chunkIndex.has_value()) {
        separate();
        oss << "chunk: " << *chunkIndex;
    }

    if (virtualOffset.has_value()) {
        separate();
        oss << "voffset: " << (*virtualOffset >> 16) << ":" << (*virtualOffset & 0xFFFF);
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// BamseekException Implementation
// =============================================================================

void BamseekException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kSeekFailed:
            throw IOError(code_, message_, ErrorContext{});
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_);
        case ErrorCode::kInvariantViolation:
            throw InvariantViolationError(message_);
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw BamseekException(ErrorCode::kSuccess, message_);
    }
    throw BamseekException(code_, message_);
}

}  // namespace bamseek
