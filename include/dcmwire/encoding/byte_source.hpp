/**
 * @file byte_source.hpp
 * @brief Seekable byte sources for the stream reader and framer
 */

#ifndef DCMWIRE_ENCODING_BYTE_SOURCE_HPP
#define DCMWIRE_ENCODING_BYTE_SOURCE_HPP

#include "dcmwire/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Abstract seekable input.
 *
 * read() returns fewer bytes than requested only at the end of the data.
 * Positions are absolute byte offsets from the start of the source.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to count bytes into dst.
     * @return Number of bytes actually read
     */
    [[nodiscard]] virtual std::size_t read(uint8_t* dst, std::size_t count) = 0;

    [[nodiscard]] virtual uint64_t tell() const noexcept = 0;

    /**
     * @brief Move to an absolute position (clamped to size()).
     */
    virtual void seek(uint64_t position) = 0;

    [[nodiscard]] virtual uint64_t size() const noexcept = 0;

    [[nodiscard]] bool at_end() const noexcept { return tell() >= size(); }

    [[nodiscard]] uint64_t remaining() const noexcept {
        return at_end() ? 0 : size() - tell();
    }

    /**
     * @brief Read up to count bytes.
     */
    [[nodiscard]] std::vector<uint8_t> read_bytes(std::size_t count);

    /**
     * @brief Read exactly count bytes or fail with insufficient_data.
     *
     * On failure the position is left at the end of the data.
     */
    [[nodiscard]] dcmwire::Result<std::vector<uint8_t>> read_exact(std::size_t count);

    /**
     * @brief Read up to count bytes without moving the position.
     */
    [[nodiscard]] std::vector<uint8_t> peek(std::size_t count);

    /**
     * @brief Move relative to the current position.
     */
    void skip(int64_t delta);

protected:
    byte_source() = default;
    byte_source(const byte_source&) = default;
    byte_source& operator=(const byte_source&) = default;
    byte_source(byte_source&&) = default;
    byte_source& operator=(byte_source&&) = default;
};

/**
 * @brief Byte source over a memory buffer.
 *
 * Either views caller-owned bytes, which must outlive the source, or owns
 * a vector.
 */
class memory_source final : public byte_source {
public:
    explicit memory_source(std::span<const uint8_t> data) noexcept;

    explicit memory_source(std::vector<uint8_t> data);

    memory_source(const memory_source&) = delete;
    memory_source& operator=(const memory_source&) = delete;

    [[nodiscard]] std::size_t read(uint8_t* dst, std::size_t count) override;
    [[nodiscard]] uint64_t tell() const noexcept override { return position_; }
    void seek(uint64_t position) override;
    [[nodiscard]] uint64_t size() const noexcept override { return view_.size(); }

    [[nodiscard]] std::span<const uint8_t> data() const noexcept { return view_; }

private:
    std::vector<uint8_t> owned_;
    std::span<const uint8_t> view_;
    uint64_t position_{0};
};

/**
 * @brief Byte source reading a file on demand.
 */
class file_source final : public byte_source {
public:
    /**
     * @brief Open a file for reading.
     */
    [[nodiscard]] static dcmwire::Result<std::unique_ptr<file_source>> open(
        const std::filesystem::path& path);

    [[nodiscard]] std::size_t read(uint8_t* dst, std::size_t count) override;
    [[nodiscard]] uint64_t tell() const noexcept override { return position_; }
    void seek(uint64_t position) override;
    [[nodiscard]] uint64_t size() const noexcept override { return size_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    file_source(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_;
    uint64_t position_{0};
};

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_BYTE_SOURCE_HPP
