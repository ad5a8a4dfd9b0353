#pragma once

#include "coffer/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace coffer::transfer {

// Sequential reader for upload content. Calls are serialized by the caller.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    
    // Reads exactly count bytes; IO_ERROR on a short read
    virtual core::Result read_next(size_t count, std::vector<std::uint8_t>& out_data) = 0;
};

class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::filesystem::path& path);
    
    bool is_open() const { return stream_.is_open(); }
    core::Result read_next(size_t count, std::vector<std::uint8_t>& out_data) override;

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::uint8_t> data);
    
    core::Result read_next(size_t count, std::vector<std::uint8_t>& out_data) override;

private:
    std::vector<std::uint8_t> data_;
    size_t offset_;
};

} // namespace coffer::transfer
