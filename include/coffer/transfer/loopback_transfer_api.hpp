#pragma once

#include "coffer/server/transfer_endpoints.hpp"
#include "coffer/transfer/transfer_api.hpp"
#include <memory>

namespace coffer::transfer {

// In-process transport that calls the server endpoints directly as one user
class LoopbackTransferApi : public TransferApi {
public:
    LoopbackTransferApi(std::shared_ptr<server::TransferEndpoints> endpoints, storage::UserId user_id);
    
    core::Result start_upload(std::uint64_t file_size, std::string& out_handle) override;
    core::Result upload_chunk(const std::string& handle,
                              std::int64_t chunk_id,
                              std::span<const std::uint8_t> data) override;
    core::Result finalise_upload(const server::FinaliseUploadRequest& request) override;
    core::Result cancel_upload(const std::string& handle) override;
    core::Result download_chunk(const std::string& handle,
                                std::int64_t chunk_id,
                                std::vector<std::uint8_t>& out_data) override;
    core::Result list_children(const std::string& parent_handle,
                               std::vector<storage::FileRecord>& out_records) override;
    core::Result create_folder(const std::string& parent_handle,
                               const std::vector<std::uint8_t>& encrypted_metadata,
                               std::string& out_handle) override;
    core::Result update_metadata(const std::vector<storage::MetadataUpdate>& updates) override;
    core::Result get_usage(std::uint64_t& out_bytes_used) override;
    
    storage::UserId user_id() const { return user_id_; }

private:
    std::shared_ptr<server::TransferEndpoints> endpoints_;
    storage::UserId user_id_;
};

} // namespace coffer::transfer
