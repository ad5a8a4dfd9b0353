#pragma once

#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/storage/file_metadata.hpp"
#include "coffer/transfer/download_sink.hpp"
#include "coffer/transfer/transfer_api.hpp"
#include "coffer/transfer/transfer_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace coffer::transfer {

constexpr size_t DEFAULT_MAX_CONCURRENT_DOWNLOADS = 4;

struct DownloadResult {
    TransferStatus status = TransferStatus::WAITING;
    core::Result result;
    std::string handle;
    // Filled in buffered mode only
    std::vector<std::uint8_t> data;
};

// Fetches a file chunk by chunk, in order, and accepts the plaintext only
// after the file signature verifies against the owner's key.
class DownloadOrchestrator {
public:
    explicit DownloadOrchestrator(std::shared_ptr<TransferApi> api);
    
    DownloadResult download_to_sink(const storage::FilesystemEntry& entry,
                                    const crypto::Ed25519PublicKey& owner_key,
                                    DownloadSink& sink,
                                    CancelPredicate should_cancel = {},
                                    ProgressCallback progress = {});
    
    DownloadResult download_to_buffer(const storage::FilesystemEntry& entry,
                                      const crypto::Ed25519PublicKey& owner_key,
                                      CancelPredicate should_cancel = {},
                                      ProgressCallback progress = {});
    
    // Independent buffered downloads, run concurrently; results keep the input order
    std::vector<DownloadResult> download_many(const std::vector<storage::FilesystemEntry>& entries,
                                              const crypto::Ed25519PublicKey& owner_key,
                                              size_t max_concurrent = DEFAULT_MAX_CONCURRENT_DOWNLOADS,
                                              CancelPredicate should_cancel = {});

private:
    DownloadResult run(const storage::FilesystemEntry& entry,
                       const crypto::Ed25519PublicKey& owner_key,
                       DownloadSink* sink,
                       std::vector<std::uint8_t>* buffer,
                       const CancelPredicate& should_cancel,
                       const ProgressCallback& progress);
    
    std::shared_ptr<TransferApi> api_;
    crypto::ChunkCodec codec_;
};

} // namespace coffer::transfer
