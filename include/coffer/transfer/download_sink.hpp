#pragma once

#include "coffer/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace coffer::transfer {

// Destination for streamed plaintext. Writes arrive strictly in chunk order.
class DownloadSink {
public:
    virtual ~DownloadSink() = default;
    
    virtual core::Result open(std::uint64_t total_size) = 0;
    virtual core::Result write(std::span<const std::uint8_t> data) = 0;
    
    // Makes the written data final
    virtual core::Result close() = 0;
    
    // Discards everything written so far
    virtual void abort() = 0;
    
    // Number of leading chunks already held after open(); 0 when starting fresh
    virtual std::uint64_t resume_chunk() const { return 0; }
    
    virtual core::Result read_back(std::uint64_t chunk_id, std::vector<std::uint8_t>& out_data) {
        (void)chunk_id;
        (void)out_data;
        return core::Result(core::ErrorCode::INVALID_STATE, "Sink cannot replay chunks");
    }
};

// Writes to <destination>.part and renames it into place on close.
// Reopening an existing partial file resumes at the last whole chunk.
class FileDownloadSink : public DownloadSink {
public:
    static constexpr const char* PARTIAL_SUFFIX = ".part";
    
    explicit FileDownloadSink(std::filesystem::path destination);
    ~FileDownloadSink() override;
    
    core::Result open(std::uint64_t total_size) override;
    core::Result write(std::span<const std::uint8_t> data) override;
    core::Result close() override;
    void abort() override;
    
    std::uint64_t resume_chunk() const override { return resume_chunk_; }
    core::Result read_back(std::uint64_t chunk_id, std::vector<std::uint8_t>& out_data) override;
    
    const std::filesystem::path& destination() const { return destination_; }
    std::filesystem::path partial_path() const;

private:
    std::filesystem::path destination_;
    std::fstream file_;
    std::uint64_t total_size_;
    std::uint64_t resume_chunk_;
};

} // namespace coffer::transfer
