#include "selfcrypt/core/result.hpp"

namespace selfcrypt::core {

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return ErrorCategory::NONE;
        case ErrorCode::EMPTY_INPUT:
        case ErrorCode::INPUT_TOO_SMALL:
        case ErrorCode::MALFORMED_DATA_MAP:
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::RECURSION_LIMIT:
            return ErrorCategory::INPUT;
        case ErrorCode::ENCRYPTION_FAILED:
        case ErrorCode::CORRUPT_CHUNK:
            return ErrorCategory::CRYPTO;
        case ErrorCode::TIMEOUT:
        case ErrorCode::UNAVAILABLE:
            return ErrorCategory::TRANSIENT_NETWORK;
        case ErrorCode::NOT_FOUND:
        case ErrorCode::PERMISSION_DENIED:
        case ErrorCode::QUOTA_EXCEEDED:
        case ErrorCode::RETRIES_EXHAUSTED:
        case ErrorCode::STORAGE_IO:
            return ErrorCategory::TERMINAL_NETWORK;
        case ErrorCode::ASSEMBLY_INTEGRITY:
            return ErrorCategory::ASSEMBLY;
        case ErrorCode::CANCELLED:
            return ErrorCategory::CANCELLED;
    }
    return ErrorCategory::NONE;
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::EMPTY_INPUT: return "empty input";
        case ErrorCode::INPUT_TOO_SMALL: return "input too small";
        case ErrorCode::MALFORMED_DATA_MAP: return "malformed data map";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::RECURSION_LIMIT: return "recursion limit";
        case ErrorCode::ENCRYPTION_FAILED: return "encryption failed";
        case ErrorCode::CORRUPT_CHUNK: return "corrupt chunk";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::UNAVAILABLE: return "unavailable";
        case ErrorCode::NOT_FOUND: return "not found";
        case ErrorCode::PERMISSION_DENIED: return "permission denied";
        case ErrorCode::QUOTA_EXCEEDED: return "quota exceeded";
        case ErrorCode::RETRIES_EXHAUSTED: return "retries exhausted";
        case ErrorCode::STORAGE_IO: return "storage i/o";
        case ErrorCode::ASSEMBLY_INTEGRITY: return "assembly integrity";
        case ErrorCode::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}
