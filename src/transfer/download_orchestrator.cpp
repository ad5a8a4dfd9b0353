#include "coffer/transfer/download_orchestrator.hpp"
#include "coffer/crypto/file_signature.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/transfer/throughput_monitor.hpp"
#include "coffer/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <new>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

namespace {
    DownloadResult finish(const std::string& handle, TransferStatus status, Result result) {
        DownloadResult outcome;
        outcome.handle = handle;
        outcome.status = status;
        outcome.result = std::move(result);
        return outcome;
    }
}

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<TransferApi> api)
    : api_(std::move(api)) {
}

DownloadResult DownloadOrchestrator::download_to_sink(const storage::FilesystemEntry& entry,
                                                      const crypto::Ed25519PublicKey& owner_key,
                                                      DownloadSink& sink,
                                                      CancelPredicate should_cancel,
                                                      ProgressCallback progress) {
    return run(entry, owner_key, &sink, nullptr, should_cancel, progress);
}

DownloadResult DownloadOrchestrator::download_to_buffer(const storage::FilesystemEntry& entry,
                                                        const crypto::Ed25519PublicKey& owner_key,
                                                        CancelPredicate should_cancel,
                                                        ProgressCallback progress) {
    std::vector<std::uint8_t> buffer;
    auto outcome = run(entry, owner_key, nullptr, &buffer, should_cancel, progress);
    if (outcome.status == TransferStatus::FINISHED) {
        outcome.data = std::move(buffer);
    }
    return outcome;
}

DownloadResult DownloadOrchestrator::run(const storage::FilesystemEntry& entry,
                                         const crypto::Ed25519PublicKey& owner_key,
                                         DownloadSink* sink,
                                         std::vector<std::uint8_t>* buffer,
                                         const CancelPredicate& should_cancel,
                                         const ProgressCallback& progress) {
    TransferProgress report;
    report.type = TransferType::DOWNLOAD;
    report.handle = entry.handle;
    report.total_bytes = entry.size;
    
    auto end_with = [&](TransferStatus status, Result result) {
        if (sink && status != TransferStatus::FINISHED) {
            sink->abort();
        }
        report.status = status;
        if (progress) {
            progress(report);
        }
        if (status == TransferStatus::FAILED) {
            LOG_WARN("Download of {} failed: {}", entry.handle, result.to_string());
        } else if (status == TransferStatus::CANCELLED) {
            LOG_INFO("Download of {} cancelled after {} bytes", entry.handle, report.bytes_transferred);
        }
        return finish(entry.handle, status, std::move(result));
    };
    
    if (entry.is_folder) {
        return finish(entry.handle, TransferStatus::FAILED,
                      Result(ErrorCode::FOLDER_HAS_NO_PHYSICAL_FILE, "Folders cannot be downloaded"));
    }
    if (!storage::is_valid_handle(entry.handle) || storage::is_root_handle(entry.handle)) {
        return finish(entry.handle, TransferStatus::FAILED, Result(ErrorCode::INVALID_ARGUMENT, "Invalid handle"));
    }
    if (entry.size > storage::MAX_FILE_SIZE) {
        return finish(entry.handle, TransferStatus::FAILED,
                      Result(ErrorCode::INVALID_ARGUMENT, "File exceeds the maximum file size"));
    }
    
    const std::uint64_t chunk_count = storage::chunk_count(entry.size);
    crypto::FileSignatureBuilder signature;
    
    std::uint64_t first_chunk = 0;
    if (sink) {
        auto result = sink->open(entry.size);
        if (!result) {
            return end_with(TransferStatus::FAILED, result);
        }
        
        // Chunks already on disk still have to pass through the signature
        first_chunk = std::min<std::uint64_t>(sink->resume_chunk(), chunk_count);
        std::vector<std::uint8_t> held;
        for (std::uint64_t chunk_id = 0; chunk_id < first_chunk; ++chunk_id) {
            result = sink->read_back(chunk_id, held);
            if (result) {
                result = signature.append(static_cast<std::int32_t>(chunk_id), held);
            }
            if (!result) {
                return end_with(TransferStatus::FAILED, result);
            }
            report.bytes_transferred += held.size();
        }
    } else {
        // The recorded size is untrusted; the buffer grows only with verified chunks
        buffer->clear();
    }
    
    ThroughputMonitor monitor;
    monitor.start();
    report.status = TransferStatus::TRANSFERRING;
    
    std::vector<std::uint8_t> encrypted;
    crypto::DecryptedChunk chunk;
    for (std::uint64_t chunk_id = first_chunk; chunk_id < chunk_count; ++chunk_id) {
        if (should_cancel && should_cancel()) {
            return end_with(TransferStatus::CANCELLED, Result());
        }
        
        auto result = api_->download_chunk(entry.handle, static_cast<std::int64_t>(chunk_id), encrypted);
        if (!result) {
            return end_with(TransferStatus::FAILED, result);
        }
        
        result = codec_.decrypt_file_chunk(encrypted, entry.file_crypt_key, chunk);
        if (!result) {
            return end_with(TransferStatus::FAILED, result);
        }
        
        if (chunk.chunk_id != static_cast<std::int32_t>(chunk_id)) {
            return end_with(TransferStatus::FAILED, Result(ErrorCode::CHUNK_ID_MISMATCH,
                "Requested chunk " + std::to_string(chunk_id) + ", received chunk " +
                std::to_string(chunk.chunk_id)));
        }
        
        auto expected_size = storage::chunk_plaintext_size(entry.size, chunk_id);
        if (chunk.plaintext.size() != expected_size) {
            return end_with(TransferStatus::FAILED, Result(ErrorCode::CHUNK_SIZE_MISMATCH,
                "Chunk " + std::to_string(chunk_id) + " carries " + std::to_string(chunk.plaintext.size()) +
                " bytes, expected " + std::to_string(expected_size)));
        }
        
        result = signature.append(chunk.chunk_id, chunk.plaintext);
        if (!result) {
            return end_with(TransferStatus::FAILED, result);
        }
        
        if (sink) {
            result = sink->write(chunk.plaintext);
            if (!result) {
                return end_with(TransferStatus::FAILED, result);
            }
        } else {
            try {
                buffer->insert(buffer->end(), chunk.plaintext.begin(), chunk.plaintext.end());
            } catch (const std::bad_alloc&) {
                buffer->clear();
                buffer->shrink_to_fit();
                return end_with(TransferStatus::FAILED, Result(ErrorCode::IO_ERROR,
                    "Out of memory after " + std::to_string(report.bytes_transferred) + " bytes"));
            }
        }
        
        monitor.on_bytes_transferred(chunk.plaintext.size());
        report.bytes_transferred += chunk.plaintext.size();
        report.speed_bps = monitor.current_speed_bps();
        if (progress) {
            progress(report);
        }
    }
    
    if (!signature.verify(owner_key, entry.signature, entry.handle)) {
        LOG_ERROR("Signature of {} does not match its content", entry.handle);
        return end_with(TransferStatus::FAILED,
                        Result(ErrorCode::SIGNATURE_MISMATCH, "File signature does not match its content"));
    }
    
    if (sink) {
        auto result = sink->close();
        if (!result) {
            return end_with(TransferStatus::FAILED, result);
        }
    }
    
    LOG_DEBUG("Downloaded and verified {} ({} bytes)", entry.handle, entry.size);
    return end_with(TransferStatus::FINISHED, Result());
}

std::vector<DownloadResult> DownloadOrchestrator::download_many(const std::vector<storage::FilesystemEntry>& entries,
                                                                const crypto::Ed25519PublicKey& owner_key,
                                                                size_t max_concurrent,
                                                                CancelPredicate should_cancel) {
    std::vector<DownloadResult> results(entries.size());
    if (entries.empty()) {
        return results;
    }
    
    boost::asio::thread_pool pool(std::max<size_t>(1, std::min(max_concurrent, entries.size())));
    for (size_t i = 0; i < entries.size(); ++i) {
        boost::asio::post(pool, [this, &entries, &results, &owner_key, &should_cancel, i]() {
            try {
                results[i] = download_to_buffer(entries[i], owner_key, should_cancel);
            } catch (const std::exception& e) {
                LOG_ERROR("Download of {} aborted: {}", entries[i].handle, e.what());
                results[i] = finish(entries[i].handle, TransferStatus::FAILED, Result(ErrorCode::IO_ERROR, e.what()));
            }
        });
    }
    pool.join();
    
    return results;
}

} // namespace coffer::transfer
