#pragma once

#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/crypto/key_manager.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/storage/file_metadata.hpp"
#include "coffer/transfer/byte_source.hpp"
#include "coffer/transfer/transfer_api.hpp"
#include "coffer/transfer/transfer_types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace coffer::transfer {

class FilesystemCache;

constexpr size_t DEFAULT_MAX_CONCURRENT_CHUNKS = 4;
constexpr std::uint64_t DEFAULT_THROUGHPUT_INCREMENT = 5'000'000; // bytes/s per extra chunk
constexpr std::chrono::milliseconds DEFAULT_RETUNE_INTERVAL{250};

struct UploadRequest {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::shared_ptr<ByteSource> source;
    std::string parent_handle{storage::ROOT_HANDLE};
    // Current time when unset
    std::optional<std::int64_t> date_added;
};

struct UploadOptions {
    size_t max_concurrent_chunks = DEFAULT_MAX_CONCURRENT_CHUNKS;
    std::uint64_t throughput_increment = DEFAULT_THROUGHPUT_INCREMENT;
    std::chrono::milliseconds retune_interval = DEFAULT_RETUNE_INTERVAL;
};

struct UploadResult {
    TransferStatus status = TransferStatus::WAITING;
    core::Result result;
    storage::FilesystemEntry entry;
};

// Encrypts and uploads one file. Chunks are read and signed in order and
// uploaded concurrently, with the number in flight tuned to the measured
// throughput.
class UploadOrchestrator {
public:
    UploadOrchestrator(std::shared_ptr<TransferApi> api,
                       const crypto::KeyManager& keys,
                       UploadOptions options = {},
                       FilesystemCache* cache = nullptr);
    
    UploadResult upload(const UploadRequest& request,
                        CancelPredicate should_cancel = {},
                        ProgressCallback progress = {});
    
    // clamp(speed / increment, 1, max_chunks)
    static size_t concurrency_limit(std::uint64_t speed_bps, std::uint64_t increment, size_t max_chunks);
    
    const UploadOptions& options() const { return options_; }

private:
    struct Job;
    
    void launch_more(const std::shared_ptr<Job>& job);
    void process_chunk(const std::shared_ptr<Job>& job);
    core::Result finalize(Job& job, storage::FilesystemEntry& out_entry);
    
    std::shared_ptr<TransferApi> api_;
    const crypto::KeyManager& keys_;
    UploadOptions options_;
    FilesystemCache* cache_;
    crypto::ChunkCodec codec_;
};

} // namespace coffer::transfer
