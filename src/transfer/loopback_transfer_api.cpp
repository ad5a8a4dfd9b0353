#include "coffer/transfer/loopback_transfer_api.hpp"
#include <nlohmann/json.hpp>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

LoopbackTransferApi::LoopbackTransferApi(std::shared_ptr<server::TransferEndpoints> endpoints,
                                         storage::UserId user_id)
    : endpoints_(std::move(endpoints))
    , user_id_(user_id) {
}

Result LoopbackTransferApi::start_upload(std::uint64_t file_size, std::string& out_handle) {
    auto response = endpoints_->start_upload(user_id_, server::StartUploadRequest{file_size});
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }
    
    auto body = nlohmann::json::parse(response.body_text(), nullptr, false);
    if (!body.is_object() || !body.contains("handle") || !body.at("handle").is_string()) {
        return Result(ErrorCode::INVALID_FORMAT, "Start upload response has no handle");
    }
    out_handle = body.at("handle").get<std::string>();
    return Result();
}

Result LoopbackTransferApi::upload_chunk(const std::string& handle,
                                         std::int64_t chunk_id,
                                         std::span<const std::uint8_t> data) {
    server::UploadChunkRequest request;
    request.handle = handle;
    request.chunk_id = chunk_id;
    request.data.assign(data.begin(), data.end());
    return result_from_response(endpoints_->upload_chunk(user_id_, request));
}

Result LoopbackTransferApi::finalise_upload(const server::FinaliseUploadRequest& request) {
    auto body = server::finalise_request_to_json(request).dump();
    return result_from_response(endpoints_->finalise_upload(user_id_, body));
}

Result LoopbackTransferApi::cancel_upload(const std::string& handle) {
    return result_from_response(endpoints_->cancel_upload(user_id_, server::CancelUploadRequest{handle}));
}

Result LoopbackTransferApi::download_chunk(const std::string& handle,
                                           std::int64_t chunk_id,
                                           std::vector<std::uint8_t>& out_data) {
    auto response = endpoints_->download_chunk(user_id_, server::DownloadChunkRequest{handle, chunk_id});
    auto result = result_from_response(response);
    if (result) {
        out_data = std::move(response.body);
    }
    return result;
}

Result LoopbackTransferApi::list_children(const std::string& parent_handle,
                                          std::vector<storage::FileRecord>& out_records) {
    auto response = endpoints_->list_children(user_id_, server::ListChildrenRequest{parent_handle});
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }
    
    auto body = nlohmann::json::parse(response.body_text(), nullptr, false);
    if (!body.is_object() || !body.contains("items") || !body.at("items").is_array()) {
        return Result(ErrorCode::INVALID_FORMAT, "List response has no items");
    }
    
    out_records.clear();
    for (const auto& item : body.at("items")) {
        storage::FileRecord record;
        result = server::file_record_from_json(item, record);
        if (!result) {
            return result;
        }
        out_records.push_back(std::move(record));
    }
    return Result();
}

Result LoopbackTransferApi::create_folder(const std::string& parent_handle,
                                         const std::vector<std::uint8_t>& encrypted_metadata,
                                         std::string& out_handle) {
    server::CreateFolderRequest request{parent_handle, encrypted_metadata};
    auto response = endpoints_->create_folder(user_id_, server::create_folder_request_to_json(request).dump());
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }
    
    auto body = nlohmann::json::parse(response.body_text(), nullptr, false);
    if (!body.is_object() || !body.contains("handle") || !body.at("handle").is_string()) {
        return Result(ErrorCode::INVALID_FORMAT, "Create folder response has no handle");
    }
    out_handle = body.at("handle").get<std::string>();
    return Result();
}

Result LoopbackTransferApi::update_metadata(const std::vector<storage::MetadataUpdate>& updates) {
    auto body = server::metadata_updates_to_json(updates).dump();
    return result_from_response(endpoints_->update_metadata(user_id_, body));
}

Result LoopbackTransferApi::get_usage(std::uint64_t& out_bytes_used) {
    auto response = endpoints_->get_usage(user_id_);
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }
    
    auto body = nlohmann::json::parse(response.body_text(), nullptr, false);
    if (!body.is_object() || !body.contains("bytesUsed") || !body.at("bytesUsed").is_number_unsigned()) {
        return Result(ErrorCode::INVALID_FORMAT, "Usage response has no bytesUsed");
    }
    out_bytes_used = body.at("bytesUsed").get<std::uint64_t>();
    return Result();
}

} // namespace coffer::transfer
