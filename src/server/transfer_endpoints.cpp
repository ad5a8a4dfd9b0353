#include "coffer/server/transfer_endpoints.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include "coffer/core/utils.hpp"
#include <chrono>

namespace coffer::server {

using core::ErrorCode;
using core::Result;

namespace {
    Result validate_handle(const std::string& handle) {
        if (!storage::is_valid_handle(handle)) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Invalid handle");
        }
        return Result();
    }

    Result validate_chunk_id(std::int64_t chunk_id) {
        if (chunk_id < 0) {
            return Result(ErrorCode::INVALID_ARGUMENT, "chunkId must not be negative");
        }
        if (chunk_id > storage::MAX_CHUNK_ID) {
            return Result(ErrorCode::INVALID_ARGUMENT, "chunkId does not fit in 32 bits");
        }
        return Result();
    }
}

TransferEndpoints::TransferEndpoints(std::shared_ptr<storage::DirectoryService> directory,
                                     std::shared_ptr<UploadSessionStore> uploads,
                                     std::shared_ptr<ChunkSessionStore> downloads)
    : directory_(std::move(directory))
    , uploads_(std::move(uploads))
    , downloads_(std::move(downloads))
    , filesystem_(directory_, uploads_) {
}

int TransferEndpoints::status_for(const Result& result) {
    switch (result.error) {
        case ErrorCode::SUCCESS:
            return http_status::OK;
        case ErrorCode::RANGE_NOT_SATISFIABLE:
            return http_status::RANGE_NOT_SATISFIABLE;
        case ErrorCode::RATE_LIMITED:
            return http_status::TOO_MANY_REQUESTS;
        case ErrorCode::IO_ERROR:
        case ErrorCode::INVALID_FORMAT:
        case ErrorCode::CRYPTO_FAILURE:
            return http_status::INTERNAL_SERVER_ERROR;
        default:
            return http_status::BAD_REQUEST;
    }
}

HttpResponse TransferEndpoints::json_response(const nlohmann::json& body) {
    HttpResponse response;
    response.status = http_status::OK;
    response.headers["Content-Type"] = "application/json";
    auto text = body.dump();
    response.body.assign(text.begin(), text.end());
    return response;
}

HttpResponse TransferEndpoints::error_response(const Result& result) {
    nlohmann::json body{
        {"error", core::error_code_name(result.error)},
        {"message", result.message}
    };
    auto response = json_response(body);
    response.status = status_for(result);
    return response;
}

HttpResponse TransferEndpoints::start_upload(storage::UserId user_id, const StartUploadRequest& request) {
    if (request.file_size > storage::MAX_FILE_SIZE) {
        return error_response(Result(ErrorCode::INVALID_ARGUMENT, "fileSize exceeds the maximum file size"));
    }

    std::string handle;
    auto result = uploads_->start_upload(user_id, request.file_size, handle);
    if (!result) {
        return error_response(result);
    }

    return json_response(nlohmann::json{{"handle", handle}});
}

HttpResponse TransferEndpoints::upload_chunk(storage::UserId user_id, const UploadChunkRequest& request) {
    auto result = validate_handle(request.handle);
    if (result) {
        result = validate_chunk_id(request.chunk_id);
    }
    if (result && (request.data.size() <= crypto::ENCRYPTED_CHUNK_EXTRA ||
                   request.data.size() > crypto::ENCRYPTED_CHUNK_SIZE)) {
        result = Result(ErrorCode::INVALID_ARGUMENT, "Chunk data has an invalid size");
    }
    if (!result) {
        return error_response(result);
    }

    result = uploads_->write_chunk(user_id, request.handle, request.chunk_id, request.data);
    if (!result) {
        return error_response(result);
    }

    return HttpResponse{};
}

HttpResponse TransferEndpoints::finalise_upload(storage::UserId user_id, const std::string& json_body) {
    FinaliseUploadRequest request;
    auto result = finalise_request_from_json(json_body, request);
    if (result) {
        result = validate_handle(request.handle);
    }
    if (result && !storage::is_valid_handle(request.parent_handle)) {
        result = Result(ErrorCode::INVALID_ARGUMENT, "Invalid parent handle");
    }
    if (!result) {
        return error_response(result);
    }

    result = uploads_->finalise_upload(user_id, request);
    if (!result) {
        return error_response(result);
    }

    return json_response(nlohmann::json{{"handle", request.handle}});
}

HttpResponse TransferEndpoints::cancel_upload(storage::UserId user_id, const CancelUploadRequest& request) {
    auto result = validate_handle(request.handle);
    if (result) {
        result = uploads_->cancel_upload(user_id, request.handle);
    }
    if (!result) {
        return error_response(result);
    }
    return HttpResponse{};
}

HttpResponse TransferEndpoints::download_chunk(storage::UserId user_id, const DownloadChunkRequest& request) {
    auto result = validate_handle(request.handle);
    if (result) {
        result = validate_chunk_id(request.chunk_id);
    }
    if (!result) {
        return error_response(result);
    }

    HttpResponse response;
    result = downloads_->read_chunk(user_id, request.handle, request.chunk_id, response.body);
    if (!result) {
        return error_response(result);
    }

    // Chunk content for a handle and chunk id never changes once written
    auto expires = std::chrono::system_clock::now() + std::chrono::seconds(CHUNK_CACHE_MAX_AGE_SECONDS);
    response.status = http_status::OK;
    response.headers["Content-Type"] = "application/octet-stream";
    response.headers["Cache-Control"] = "public, max-age=" + std::to_string(CHUNK_CACHE_MAX_AGE_SECONDS);
    response.headers["Expires"] = core::utils::TimeUtils::to_http_date(expires);
    return response;
}

HttpResponse TransferEndpoints::list_children(storage::UserId user_id, const ListChildrenRequest& request) {
    auto result = validate_handle(request.parent_handle);
    if (!result) {
        return error_response(result);
    }

    result = storage::check_parent_folder(*directory_, user_id, request.parent_handle);
    if (!result) {
        return error_response(result);
    }

    std::vector<storage::FileRecord> records;
    result = directory_->list_children(user_id, request.parent_handle, records);
    if (!result) {
        LOG_ERROR("Failed to list children of {}: {}", request.parent_handle, result.message);
        return error_response(result);
    }

    auto items = nlohmann::json::array();
    for (const auto& record : records) {
        items.push_back(file_record_to_json(record));
    }
    return json_response(nlohmann::json{{"items", items}});
}

HttpResponse TransferEndpoints::create_folder(storage::UserId user_id, const std::string& json_body) {
    CreateFolderRequest request;
    auto result = create_folder_request_from_json(json_body, request);
    if (!result) {
        return error_response(result);
    }

    std::string handle;
    result = filesystem_.create_folder(user_id, request.parent_handle, request.encrypted_metadata, handle);
    if (!result) {
        return error_response(result);
    }

    return json_response(nlohmann::json{{"handle", handle}});
}

HttpResponse TransferEndpoints::update_metadata(storage::UserId user_id, const std::string& json_body) {
    std::vector<storage::MetadataUpdate> updates;
    auto result = metadata_updates_from_json(json_body, updates);
    if (result) {
        result = filesystem_.update_metadata(user_id, updates);
    }
    if (!result) {
        return error_response(result);
    }
    return HttpResponse{};
}

HttpResponse TransferEndpoints::get_usage(storage::UserId user_id) {
    std::uint64_t bytes_used = 0;
    auto result = filesystem_.storage_used(user_id, bytes_used);
    if (!result) {
        LOG_ERROR("Failed to compute usage of user {}: {}", user_id, result.message);
        return error_response(result);
    }
    return json_response(nlohmann::json{{"bytesUsed", bytes_used}});
}

} // namespace coffer::server
