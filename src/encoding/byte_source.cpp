/**
 * @file byte_source.cpp
 * @brief Implementation of the memory and file byte sources
 */

#include "dcmwire/encoding/byte_source.hpp"

#include <algorithm>
#include <cstring>

namespace dcmwire::encoding {

// ============================================================================
// byte_source
// ============================================================================

std::vector<uint8_t> byte_source::read_bytes(std::size_t count) {
    const auto available = static_cast<std::size_t>(std::min<uint64_t>(count, remaining()));
    std::vector<uint8_t> buffer(available);
    const auto got = read(buffer.data(), available);
    buffer.resize(got);
    return buffer;
}

dcmwire::Result<std::vector<uint8_t>> byte_source::read_exact(std::size_t count) {
    const auto start = tell();
    auto buffer = read_bytes(count);
    if (buffer.size() != count) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::insufficient_data,
            "Expected " + std::to_string(count) + " bytes at offset " +
                std::to_string(start) + " but only " +
                std::to_string(buffer.size()) + " were available");
    }
    return dcmwire::ok(std::move(buffer));
}

std::vector<uint8_t> byte_source::peek(std::size_t count) {
    const auto start = tell();
    auto buffer = read_bytes(count);
    seek(start);
    return buffer;
}

void byte_source::skip(int64_t delta) {
    const auto position = static_cast<int64_t>(tell()) + delta;
    seek(position < 0 ? 0 : static_cast<uint64_t>(position));
}

// ============================================================================
// memory_source
// ============================================================================

memory_source::memory_source(std::span<const uint8_t> data) noexcept
    : view_(data) {}

memory_source::memory_source(std::vector<uint8_t> data)
    : owned_(std::move(data)), view_(owned_) {}

std::size_t memory_source::read(uint8_t* dst, std::size_t count) {
    const auto available = static_cast<std::size_t>(
        std::min<uint64_t>(count, remaining()));
    if (available > 0) {
        std::memcpy(dst, view_.data() + position_, available);
        position_ += available;
    }
    return available;
}

void memory_source::seek(uint64_t position) {
    position_ = std::min<uint64_t>(position, view_.size());
}

// ============================================================================
// file_source
// ============================================================================

dcmwire::Result<std::unique_ptr<file_source>> file_source::open(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return dcmwire::dcmwire_error<std::unique_ptr<file_source>>(
            dcmwire::error_codes::file_not_found,
            "File not found: " + path.string());
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return dcmwire::dcmwire_error<std::unique_ptr<file_source>>(
            dcmwire::error_codes::file_read_error,
            "Failed to get file size: " + path.string(), ec.message());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return dcmwire::dcmwire_error<std::unique_ptr<file_source>>(
            dcmwire::error_codes::file_read_error,
            "Failed to open file: " + path.string());
    }

    return dcmwire::ok(std::unique_ptr<file_source>(
        new file_source(path, std::move(stream), size)));
}

file_source::file_source(std::filesystem::path path, std::ifstream stream, uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

std::size_t file_source::read(uint8_t* dst, std::size_t count) {
    const auto available = static_cast<std::size_t>(
        std::min<uint64_t>(count, remaining()));
    if (available == 0) {
        return 0;
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(position_));
    stream_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(available));
    const auto got = static_cast<std::size_t>(stream_.gcount());
    position_ += got;
    return got;
}

void file_source::seek(uint64_t position) {
    position_ = std::min<uint64_t>(position, size_);
}

}  // namespace dcmwire::encoding
