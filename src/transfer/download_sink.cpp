#include "coffer/transfer/download_sink.hpp"
#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/core/logger.hpp"
#include <algorithm>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

FileDownloadSink::FileDownloadSink(std::filesystem::path destination)
    : destination_(std::move(destination))
    , total_size_(0)
    , resume_chunk_(0) {
}

FileDownloadSink::~FileDownloadSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::filesystem::path FileDownloadSink::partial_path() const {
    auto path = destination_;
    path += PARTIAL_SUFFIX;
    return path;
}

Result FileDownloadSink::open(std::uint64_t total_size) {
    total_size_ = total_size;
    resume_chunk_ = 0;
    
    auto path = partial_path();
    std::error_code ec;
    if (destination_.has_parent_path()) {
        std::filesystem::create_directories(destination_.parent_path(), ec);
    }
    
    std::uint64_t existing = 0;
    if (std::filesystem::exists(path, ec)) {
        existing = std::filesystem::file_size(path, ec);
        if (ec) {
            existing = 0;
        }
    }
    
    // Only whole chunks are trusted; a torn tail is dropped
    std::uint64_t whole_chunks = std::min(existing, total_size) / crypto::CHUNK_DATA_SIZE;
    std::uint64_t keep = whole_chunks * crypto::CHUNK_DATA_SIZE;
    
    if (existing > 0) {
        std::filesystem::resize_file(path, keep, ec);
        if (ec) {
            LOG_ERROR("Cannot truncate partial download {}: {}", path.string(), ec.message());
            return Result(ErrorCode::IO_ERROR, "Cannot truncate partial download");
        }
    } else {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create.is_open()) {
            LOG_ERROR("Cannot create partial download {}", path.string());
            return Result(ErrorCode::IO_ERROR, "Cannot create download file");
        }
    }
    
    file_.open(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file_.is_open()) {
        LOG_ERROR("Cannot open partial download {}", path.string());
        return Result(ErrorCode::IO_ERROR, "Cannot open download file");
    }
    file_.seekp(static_cast<std::streamoff>(keep), std::ios::beg);
    
    resume_chunk_ = whole_chunks;
    if (resume_chunk_ > 0) {
        LOG_INFO("Resuming download into {} at chunk {}", destination_.string(), resume_chunk_);
    }
    return Result();
}

Result FileDownloadSink::write(std::span<const std::uint8_t> data) {
    if (!file_.is_open()) {
        return Result(ErrorCode::INVALID_STATE, "Download sink is not open");
    }
    
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_.good()) {
        LOG_ERROR("Write to {} failed", partial_path().string());
        return Result(ErrorCode::IO_ERROR, "Failed to write downloaded data");
    }
    return Result();
}

Result FileDownloadSink::read_back(std::uint64_t chunk_id, std::vector<std::uint8_t>& out_data) {
    if (!file_.is_open()) {
        return Result(ErrorCode::INVALID_STATE, "Download sink is not open");
    }
    if (chunk_id >= resume_chunk_) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Chunk " + std::to_string(chunk_id) + " is not held");
    }
    
    out_data.resize(crypto::CHUNK_DATA_SIZE);
    auto write_position = file_.tellp();
    file_.seekg(static_cast<std::streamoff>(chunk_id * crypto::CHUNK_DATA_SIZE), std::ios::beg);
    file_.read(reinterpret_cast<char*>(out_data.data()), static_cast<std::streamsize>(out_data.size()));
    bool ok = file_.gcount() == static_cast<std::streamsize>(out_data.size());
    file_.clear();
    file_.seekp(write_position);
    
    if (!ok) {
        return Result(ErrorCode::IO_ERROR, "Short read from partial download");
    }
    return Result();
}

Result FileDownloadSink::close() {
    if (!file_.is_open()) {
        return Result(ErrorCode::INVALID_STATE, "Download sink is not open");
    }
    
    file_.close();
    if (file_.fail()) {
        return Result(ErrorCode::IO_ERROR, "Failed to flush downloaded file");
    }
    
    std::error_code ec;
    std::filesystem::rename(partial_path(), destination_, ec);
    if (ec) {
        LOG_ERROR("Failed to move {} to {}: {}", partial_path().string(), destination_.string(), ec.message());
        return Result(ErrorCode::IO_ERROR, "Failed to finish download file");
    }
    return Result();
}

void FileDownloadSink::abort() {
    if (file_.is_open()) {
        file_.close();
    }
    
    std::error_code ec;
    std::filesystem::remove(partial_path(), ec);
    if (ec) {
        LOG_WARN("Failed to remove {}: {}", partial_path().string(), ec.message());
    }
    resume_chunk_ = 0;
}

} // namespace coffer::transfer
