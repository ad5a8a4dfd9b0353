#pragma once

#include <string>
#include <utility>

namespace coffer::core {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_KEY_LENGTH,
    AUTHENTICATION_FAILED,
    CHUNK_ID_MISMATCH,
    CHUNK_SIZE_MISMATCH,
    SIGNATURE_MISMATCH,
    NOT_FOUND,
    OWNERSHIP_MISMATCH,
    FOLDER_HAS_NO_PHYSICAL_FILE,
    RANGE_NOT_SATISFIABLE,
    RATE_LIMITED,
    IO_ERROR,
    METADATA_TOO_LARGE,
    INVALID_STATE,
    INVALID_ARGUMENT,
    INVALID_FORMAT,
    CRYPTO_FAILURE
};

const char* error_code_name(ErrorCode code);

// Inverse of error_code_name; unknown names map to IO_ERROR
ErrorCode error_code_from_name(const std::string& name);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
    
    std::string to_string() const;
};

} // namespace coffer::core
