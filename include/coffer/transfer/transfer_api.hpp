#pragma once

#include "coffer/core/result.hpp"
#include "coffer/server/transfer_schemas.hpp"
#include "coffer/storage/directory_service.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace coffer::transfer {

// Client side of the transfer endpoints. Implementations must be callable
// from several chunk threads at once.
class TransferApi {
public:
    virtual ~TransferApi() = default;
    
    virtual core::Result start_upload(std::uint64_t file_size, std::string& out_handle) = 0;
    
    // RATE_LIMITED when the server answers 429
    virtual core::Result upload_chunk(const std::string& handle,
                                      std::int64_t chunk_id,
                                      std::span<const std::uint8_t> data) = 0;
    
    virtual core::Result finalise_upload(const server::FinaliseUploadRequest& request) = 0;
    
    virtual core::Result cancel_upload(const std::string& handle) = 0;
    
    // RANGE_NOT_SATISFIABLE when the server answers 416
    virtual core::Result download_chunk(const std::string& handle,
                                        std::int64_t chunk_id,
                                        std::vector<std::uint8_t>& out_data) = 0;
    
    virtual core::Result list_children(const std::string& parent_handle,
                                       std::vector<storage::FileRecord>& out_records) = 0;
    
    virtual core::Result create_folder(const std::string& parent_handle,
                                       const std::vector<std::uint8_t>& encrypted_metadata,
                                       std::string& out_handle) = 0;
    
    virtual core::Result update_metadata(const std::vector<storage::MetadataUpdate>& updates) = 0;
    
    virtual core::Result get_usage(std::uint64_t& out_bytes_used) = 0;
};

// Turns a non-200 response into the error it carries
core::Result result_from_response(const server::HttpResponse& response);

} // namespace coffer::transfer
