#include "coffer/transfer/upload_orchestrator.hpp"
#include "coffer/crypto/file_signature.hpp"
#include "coffer/crypto/random.hpp"
#include "coffer/transfer/filesystem_cache.hpp"
#include "coffer/transfer/throughput_monitor.hpp"
#include "coffer/core/logger.hpp"
#include "coffer/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

struct UploadOrchestrator::Job {
    std::string handle;
    std::string parent_handle;
    std::string file_name;
    std::int64_t date_added = 0;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_count = 0;
    crypto::FileCryptKey file_key{};
    std::vector<std::uint8_t> encrypted_metadata;
    std::vector<std::uint8_t> encrypted_file_key;
    CancelPredicate should_cancel;
    ProgressCallback progress;
    
    std::unique_ptr<boost::asio::thread_pool> pool;
    
    // Scheduling state
    std::mutex state_mutex;
    std::condition_variable state_changed;
    std::uint64_t launched = 0;
    std::uint64_t finished = 0;
    size_t in_flight = 0;
    size_t limit = 1;
    bool stopped = false;
    bool cancelled = false;
    Result failure;
    
    // Source reads and signature appends happen together so chunk ids stay in order
    std::mutex read_mutex;
    std::shared_ptr<ByteSource> source;
    crypto::FileSignatureBuilder signature;
    std::int64_t next_read_chunk = 0;
    bool read_failed = false;
    
    std::mutex progress_mutex;
    TransferProgress report;
    ThroughputMonitor monitor;
    
    ~Job() {
        crypto::secure_zero(file_key);
    }
    
    // First failure wins; later ones are only logged
    void fail(const Result& result) {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!stopped) {
            stopped = true;
            failure = result;
        } else {
            LOG_DEBUG("Upload {} already stopped, ignoring: {}", handle, result.to_string());
        }
    }
};

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<TransferApi> api,
                                       const crypto::KeyManager& keys,
                                       UploadOptions options,
                                       FilesystemCache* cache)
    : api_(std::move(api))
    , keys_(keys)
    , options_(options)
    , cache_(cache) {
    
    options_.max_concurrent_chunks = std::max<size_t>(1, options_.max_concurrent_chunks);
    options_.throughput_increment = std::max<std::uint64_t>(1, options_.throughput_increment);
}

size_t UploadOrchestrator::concurrency_limit(std::uint64_t speed_bps, std::uint64_t increment, size_t max_chunks) {
    if (increment == 0) {
        return std::max<size_t>(1, max_chunks);
    }
    std::uint64_t steps = speed_bps / increment;
    return static_cast<size_t>(std::clamp<std::uint64_t>(steps, 1, std::max<size_t>(1, max_chunks)));
}

// Caller holds job->state_mutex
void UploadOrchestrator::launch_more(const std::shared_ptr<Job>& job) {
    while (!job->stopped && job->in_flight < job->limit && job->launched < job->chunk_count) {
        if (job->should_cancel && job->should_cancel()) {
            job->stopped = true;
            job->cancelled = true;
            break;
        }
        
        job->launched++;
        job->in_flight++;
        boost::asio::post(*job->pool, [this, job]() {
            process_chunk(job);
        });
    }
}

void UploadOrchestrator::process_chunk(const std::shared_ptr<Job>& job) {
    std::int32_t chunk_id = 0;
    std::vector<std::uint8_t> plaintext;
    Result result;
    {
        std::lock_guard<std::mutex> lock(job->read_mutex);
        chunk_id = static_cast<std::int32_t>(job->next_read_chunk++);
        if (job->read_failed) {
            result = Result(ErrorCode::INVALID_STATE, "Source is unusable after an earlier failure");
        } else {
            result = job->source->read_next(storage::chunk_plaintext_size(job->file_size, chunk_id), plaintext);
            if (result) {
                result = job->signature.append(chunk_id, plaintext);
            }
            if (!result) {
                job->read_failed = true;
                job->fail(result);
            }
        }
    }
    
    std::vector<std::uint8_t> encrypted;
    if (result) {
        result = codec_.encrypt_file_chunk(chunk_id, plaintext, job->file_key, encrypted);
    }
    if (result) {
        result = api_->upload_chunk(job->handle, chunk_id, encrypted);
    }
    
    if (result) {
        std::lock_guard<std::mutex> lock(job->progress_mutex);
        job->monitor.on_bytes_transferred(plaintext.size());
        job->report.bytes_transferred += plaintext.size();
        job->report.speed_bps = job->monitor.current_speed_bps();
        if (job->progress) {
            job->progress(job->report);
        }
    } else {
        LOG_WARN("Chunk {} of upload {} failed: {}", chunk_id, job->handle, result.to_string());
        job->fail(result);
    }
    
    std::lock_guard<std::mutex> lock(job->state_mutex);
    job->in_flight--;
    if (result) {
        job->finished++;
    }
    launch_more(job);
    job->state_changed.notify_all();
}

UploadResult UploadOrchestrator::upload(const UploadRequest& request,
                                        CancelPredicate should_cancel,
                                        ProgressCallback progress) {
    UploadResult outcome;
    outcome.status = TransferStatus::FAILED;
    
    if (request.file_size > storage::MAX_FILE_SIZE) {
        outcome.result = Result(ErrorCode::INVALID_ARGUMENT, "File exceeds the maximum file size");
        return outcome;
    }
    if (!storage::is_valid_handle(request.parent_handle)) {
        outcome.result = Result(ErrorCode::INVALID_ARGUMENT, "Invalid parent handle");
        return outcome;
    }
    if (!request.source || request.file_name.empty()) {
        outcome.result = Result(ErrorCode::INVALID_ARGUMENT, "Upload needs a file name and a source");
        return outcome;
    }
    
    auto job = std::make_shared<Job>();
    job->parent_handle = request.parent_handle;
    job->file_name = request.file_name;
    job->date_added = request.date_added.value_or(core::utils::TimeUtils::unix_seconds());
    job->file_size = request.file_size;
    job->chunk_count = storage::chunk_count(request.file_size);
    job->file_key = crypto::SecureRandom::generate_key();
    job->source = request.source;
    job->should_cancel = std::move(should_cancel);
    job->progress = std::move(progress);
    job->report.type = TransferType::UPLOAD;
    job->report.status = TransferStatus::TRANSFERRING;
    job->report.total_bytes = request.file_size;
    
    // Oversized metadata is rejected before any data moves
    storage::FileMetadata metadata{job->file_name, job->date_added, false};
    auto result = codec_.encrypt_file_metadata(metadata, keys_.master_key(), job->encrypted_metadata);
    if (result) {
        result = codec_.encrypt_file_crypt_key(job->file_key, keys_.master_key(), job->encrypted_file_key);
    }
    if (!result) {
        LOG_WARN("Cannot prepare upload of {}: {}", request.file_name, result.to_string());
        outcome.result = result;
        return outcome;
    }
    
    result = api_->start_upload(request.file_size, job->handle);
    if (!result) {
        LOG_WARN("Server refused upload of {}: {}", request.file_name, result.to_string());
        outcome.result = result;
        return outcome;
    }
    job->report.handle = job->handle;
    
    LOG_INFO("Uploading {} as {} ({}, {} chunks)", request.file_name, job->handle,
             core::utils::StringUtils::format_bytes(request.file_size), job->chunk_count);
    
    job->monitor.start();
    job->pool = std::make_unique<boost::asio::thread_pool>(options_.max_concurrent_chunks);
    {
        std::unique_lock<std::mutex> lock(job->state_mutex);
        launch_more(job);
        
        while (!(job->in_flight == 0 && (job->stopped || job->finished == job->chunk_count))) {
            job->state_changed.wait_for(lock, options_.retune_interval);
            if (job->stopped) {
                continue;
            }
            
            size_t limit = concurrency_limit(job->monitor.current_speed_bps(),
                                             options_.throughput_increment,
                                             options_.max_concurrent_chunks);
            if (limit != job->limit) {
                LOG_TRACE("Upload {} concurrency {} -> {}", job->handle, job->limit, limit);
                job->limit = limit;
            }
            launch_more(job);
        }
    }
    job->pool->join();
    
    auto report_final = [&](TransferStatus status) {
        std::lock_guard<std::mutex> lock(job->progress_mutex);
        job->report.status = status;
        if (job->progress) {
            job->progress(job->report);
        }
    };
    
    auto discard_remote = [&]() {
        auto cancel_result = api_->cancel_upload(job->handle);
        if (!cancel_result) {
            LOG_DEBUG("Could not discard upload {}: {}", job->handle, cancel_result.to_string());
        }
    };
    
    if (job->cancelled || !job->failure) {
        discard_remote();
        
        if (job->cancelled) {
            LOG_INFO("Upload of {} cancelled", request.file_name);
            outcome.status = TransferStatus::CANCELLED;
            outcome.result = Result();
        } else {
            outcome.result = job->failure;
        }
        report_final(outcome.status);
        return outcome;
    }
    
    result = finalize(*job, outcome.entry);
    if (!result) {
        LOG_WARN("Finalizing upload {} failed: {}", job->handle, result.to_string());
        discard_remote();
        outcome.result = result;
        report_final(TransferStatus::FAILED);
        return outcome;
    }
    
    if (cache_) {
        cache_->insert(outcome.entry);
    }
    
    LOG_INFO("Uploaded {} as {}", request.file_name, job->handle);
    outcome.status = TransferStatus::FINISHED;
    outcome.result = Result();
    report_final(TransferStatus::FINISHED);
    return outcome;
}

Result UploadOrchestrator::finalize(Job& job, storage::FilesystemEntry& out_entry) {
    crypto::Ed25519Signature signature;
    auto result = job.signature.finalize(keys_.signing_keys().secret_key, job.handle, signature);
    if (!result) {
        return result;
    }
    
    server::FinaliseUploadRequest request;
    request.handle = job.handle;
    request.parent_handle = job.parent_handle;
    request.encrypted_metadata = job.encrypted_metadata;
    request.encrypted_file_crypt_key = job.encrypted_file_key;
    request.signature.assign(signature.begin(), signature.end());
    
    result = api_->finalise_upload(request);
    if (!result) {
        return result;
    }
    
    out_entry.handle = job.handle;
    out_entry.parent_handle = job.parent_handle;
    out_entry.name = job.file_name;
    out_entry.size = job.file_size;
    out_entry.encrypted_file_size = storage::encrypted_file_size(job.file_size);
    out_entry.file_crypt_key = job.file_key;
    out_entry.is_folder = false;
    out_entry.signature = signature;
    out_entry.date_added = job.date_added;
    return Result();
}

} // namespace coffer::transfer
