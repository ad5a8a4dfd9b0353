#include "coffer/transfer/byte_source.hpp"
#include "coffer/core/logger.hpp"

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

FileByteSource::FileByteSource(const std::filesystem::path& path)
    : path_(path)
    , stream_(path, std::ios::binary) {
}

Result FileByteSource::read_next(size_t count, std::vector<std::uint8_t>& out_data) {
    if (!stream_.is_open()) {
        return Result(ErrorCode::IO_ERROR, "Cannot open " + path_.string());
    }
    
    out_data.resize(count);
    stream_.read(reinterpret_cast<char*>(out_data.data()), static_cast<std::streamsize>(count));
    if (stream_.gcount() != static_cast<std::streamsize>(count)) {
        LOG_ERROR("Short read from {}: wanted {} bytes, got {}", path_.string(), count, stream_.gcount());
        return Result(ErrorCode::IO_ERROR, "Source file ended early");
    }
    return Result();
}

MemoryByteSource::MemoryByteSource(std::vector<std::uint8_t> data)
    : data_(std::move(data))
    , offset_(0) {
}

Result MemoryByteSource::read_next(size_t count, std::vector<std::uint8_t>& out_data) {
    if (data_.size() - offset_ < count) {
        return Result(ErrorCode::IO_ERROR, "Source buffer ended early");
    }
    out_data.assign(data_.begin() + offset_, data_.begin() + offset_ + count);
    offset_ += count;
    return Result();
}

} // namespace coffer::transfer
