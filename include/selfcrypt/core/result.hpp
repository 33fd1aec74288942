#pragma once

#include <string>
#include <utility>

namespace selfcrypt::core {

// Error codes shared by every pipeline stage
enum class ErrorCode {
    SUCCESS = 0,
    
    // Input
    EMPTY_INPUT,
    INPUT_TOO_SMALL,
    MALFORMED_DATA_MAP,
    INVALID_ARGUMENT,
    RECURSION_LIMIT,
    
    // Cryptographic
    ENCRYPTION_FAILED,
    CORRUPT_CHUNK,
    
    // Network, transient
    TIMEOUT,
    UNAVAILABLE,
    
    // Network, terminal
    NOT_FOUND,
    PERMISSION_DENIED,
    QUOTA_EXCEEDED,
    RETRIES_EXHAUSTED,
    STORAGE_IO,
    
    // Assembly
    ASSEMBLY_INTEGRITY,
    
    CANCELLED
};

enum class ErrorCategory {
    NONE,
    INPUT,
    CRYPTO,
    TRANSIENT_NETWORK,
    TERMINAL_NETWORK,
    ASSEMBLY,
    CANCELLED
};

ErrorCategory category_of(ErrorCode code);
const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
    
    ErrorCategory category() const { return category_of(error); }
    bool is_transient() const { return category() == ErrorCategory::TRANSIENT_NETWORK; }
    
    std::string describe() const;
};

}
