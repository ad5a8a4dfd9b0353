#include "coffer/core/result.hpp"

namespace coffer::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_KEY_LENGTH: return "InvalidKeyLength";
        case ErrorCode::AUTHENTICATION_FAILED: return "AuthenticationFailed";
        case ErrorCode::CHUNK_ID_MISMATCH: return "ChunkIdMismatch";
        case ErrorCode::CHUNK_SIZE_MISMATCH: return "ChunkSizeMismatch";
        case ErrorCode::SIGNATURE_MISMATCH: return "SignatureMismatch";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::OWNERSHIP_MISMATCH: return "OwnershipMismatch";
        case ErrorCode::FOLDER_HAS_NO_PHYSICAL_FILE: return "FolderHasNoPhysicalFile";
        case ErrorCode::RANGE_NOT_SATISFIABLE: return "RangeNotSatisfiable";
        case ErrorCode::RATE_LIMITED: return "RateLimited";
        case ErrorCode::IO_ERROR: return "Io";
        case ErrorCode::METADATA_TOO_LARGE: return "MetadataTooLarge";
        case ErrorCode::INVALID_STATE: return "InvalidState";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::INVALID_FORMAT: return "InvalidFormat";
        case ErrorCode::CRYPTO_FAILURE: return "CryptoFailure";
    }
    return "Unknown";
}

ErrorCode error_code_from_name(const std::string& name) {
    for (int i = static_cast<int>(ErrorCode::SUCCESS); i <= static_cast<int>(ErrorCode::CRYPTO_FAILURE); ++i) {
        auto code = static_cast<ErrorCode>(i);
        if (name == error_code_name(code)) {
            return code;
        }
    }
    return ErrorCode::IO_ERROR;
}

std::string Result::to_string() const {
    if (message.empty()) {
        return error_code_name(error);
    }
    return std::string(error_code_name(error)) + ": " + message;
}

} // namespace coffer::core
