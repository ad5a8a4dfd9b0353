#pragma once

#include "coffer/server/chunk_session_store.hpp"
#include "coffer/server/filesystem_service.hpp"
#include "coffer/server/transfer_schemas.hpp"
#include "coffer/server/upload_session_store.hpp"
#include "coffer/storage/directory_service.hpp"
#include <memory>
#include <string>

namespace coffer::server {

constexpr int CHUNK_CACHE_MAX_AGE_SECONDS = 3600;

// Validates typed requests and maps core results onto HTTP status codes
class TransferEndpoints {
public:
    TransferEndpoints(std::shared_ptr<storage::DirectoryService> directory,
                      std::shared_ptr<UploadSessionStore> uploads,
                      std::shared_ptr<ChunkSessionStore> downloads);

    HttpResponse start_upload(storage::UserId user_id, const StartUploadRequest& request);
    HttpResponse upload_chunk(storage::UserId user_id, const UploadChunkRequest& request);
    HttpResponse finalise_upload(storage::UserId user_id, const std::string& json_body);
    HttpResponse cancel_upload(storage::UserId user_id, const CancelUploadRequest& request);
    HttpResponse download_chunk(storage::UserId user_id, const DownloadChunkRequest& request);
    HttpResponse list_children(storage::UserId user_id, const ListChildrenRequest& request);
    HttpResponse create_folder(storage::UserId user_id, const std::string& json_body);
    HttpResponse update_metadata(storage::UserId user_id, const std::string& json_body);
    // {"bytesUsed": n}
    HttpResponse get_usage(storage::UserId user_id);

    static int status_for(const core::Result& result);
    static HttpResponse error_response(const core::Result& result);
    static HttpResponse json_response(const nlohmann::json& body);

private:
    std::shared_ptr<storage::DirectoryService> directory_;
    std::shared_ptr<UploadSessionStore> uploads_;
    std::shared_ptr<ChunkSessionStore> downloads_;
    FilesystemService filesystem_;
};

} // namespace coffer::server
