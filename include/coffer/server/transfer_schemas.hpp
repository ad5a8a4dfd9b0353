#pragma once

#include "coffer/core/result.hpp"
#include "coffer/storage/directory_service.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace coffer::server {

// One struct per endpoint payload; all validation happens in TransferEndpoints

struct StartUploadRequest {
    std::uint64_t file_size = 0;
};

struct UploadChunkRequest {
    std::string handle;
    std::int64_t chunk_id = 0;
    std::vector<std::uint8_t> data;
};

struct FinaliseUploadRequest {
    std::string handle;
    std::string parent_handle;
    std::vector<std::uint8_t> encrypted_metadata;
    std::vector<std::uint8_t> encrypted_file_crypt_key;
    std::vector<std::uint8_t> signature;
};

struct CancelUploadRequest {
    std::string handle;
};

struct DownloadChunkRequest {
    std::string handle;
    std::int64_t chunk_id = 0;
};

struct ListChildrenRequest {
    std::string parent_handle;
};

struct CreateFolderRequest {
    std::string parent_handle;
    std::vector<std::uint8_t> encrypted_metadata;
};

struct HttpResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    bool ok() const { return status == 200; }
    std::string body_text() const { return std::string(body.begin(), body.end()); }
};

namespace http_status {
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int RANGE_NOT_SATISFIABLE = 416;
    constexpr int TOO_MANY_REQUESTS = 429;
    constexpr int INTERNAL_SERVER_ERROR = 500;
}

// Binary fields travel as base64 strings
nlohmann::json finalise_request_to_json(const FinaliseUploadRequest& request);
core::Result finalise_request_from_json(const std::string& body, FinaliseUploadRequest& out_request);

nlohmann::json create_folder_request_to_json(const CreateFolderRequest& request);
core::Result create_folder_request_from_json(const std::string& body, CreateFolderRequest& out_request);

// Body of a metadata update is a JSON array of {handle, encryptedMetadata}
nlohmann::json metadata_updates_to_json(const std::vector<storage::MetadataUpdate>& updates);
core::Result metadata_updates_from_json(const std::string& body, std::vector<storage::MetadataUpdate>& out_updates);

nlohmann::json file_record_to_json(const storage::FileRecord& record);
core::Result file_record_from_json(const nlohmann::json& j, storage::FileRecord& out_record);

} // namespace coffer::server
