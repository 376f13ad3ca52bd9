/**
 * @file byte_order.hpp
 * @brief Byte ordering and endian-aware integer load/store helpers
 *
 * @see DICOM PS3.5 Section 7.3 - Ordering of Bytes
 */

#ifndef DCMWIRE_ENCODING_BYTE_ORDER_HPP
#define DCMWIRE_ENCODING_BYTE_ORDER_HPP

#include <cstdint>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Byte ordering for DICOM data encoding.
 */
enum class byte_order {
    little_endian,  ///< Least significant byte first (most common)
    big_endian      ///< Most significant byte first (retired syntax)
};

/**
 * @brief Value Representation encoding mode.
 */
enum class vr_encoding {
    implicit,    ///< VR determined from data dictionary lookup
    explicit_vr  ///< VR explicitly encoded in the data stream
};

/// @name Single Value Byte Swapping
/// @{

[[nodiscard]] constexpr uint16_t byte_swap16(uint16_t value) noexcept {
    return static_cast<uint16_t>((value >> 8) | (value << 8));
}

[[nodiscard]] constexpr uint32_t byte_swap32(uint32_t value) noexcept {
    return ((value >> 24) & 0x000000FF) |
           ((value >> 8)  & 0x0000FF00) |
           ((value << 8)  & 0x00FF0000) |
           ((value << 24) & 0xFF000000);
}

[[nodiscard]] constexpr uint64_t byte_swap64(uint64_t value) noexcept {
    return (static_cast<uint64_t>(byte_swap32(static_cast<uint32_t>(value))) << 32) |
           byte_swap32(static_cast<uint32_t>(value >> 32));
}

/// @}

/// @name Endian-Aware Read Functions
/// @{

/**
 * @brief Reads a 16-bit value stored in the given byte order.
 * @param data Pointer to at least 2 bytes
 */
[[nodiscard]] constexpr uint16_t read_u16(const uint8_t* data, byte_order order) noexcept {
    if (order == byte_order::big_endian) {
        return static_cast<uint16_t>((data[0] << 8) | data[1]);
    }
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

/**
 * @brief Reads a 32-bit value stored in the given byte order.
 * @param data Pointer to at least 4 bytes
 */
[[nodiscard]] constexpr uint32_t read_u32(const uint8_t* data, byte_order order) noexcept {
    if (order == byte_order::big_endian) {
        return (static_cast<uint32_t>(data[0]) << 24) |
               (static_cast<uint32_t>(data[1]) << 16) |
               (static_cast<uint32_t>(data[2]) << 8) |
               static_cast<uint32_t>(data[3]);
    }
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

/**
 * @brief Reads a 64-bit value stored in the given byte order.
 * @param data Pointer to at least 8 bytes
 */
[[nodiscard]] constexpr uint64_t read_u64(const uint8_t* data, byte_order order) noexcept {
    const uint64_t first = read_u32(data, order);
    const uint64_t second = read_u32(data + 4, order);
    if (order == byte_order::big_endian) {
        return (first << 32) | second;
    }
    return (second << 32) | first;
}

/// @}

/// @name Endian-Aware Write Functions
/// @{

inline void write_u16(std::vector<uint8_t>& buffer, uint16_t value, byte_order order) {
    if (order == byte_order::big_endian) {
        buffer.push_back(static_cast<uint8_t>(value >> 8));
        buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    } else {
        buffer.push_back(static_cast<uint8_t>(value & 0xFF));
        buffer.push_back(static_cast<uint8_t>(value >> 8));
    }
}

inline void write_u32(std::vector<uint8_t>& buffer, uint32_t value, byte_order order) {
    if (order == byte_order::big_endian) {
        write_u16(buffer, static_cast<uint16_t>(value >> 16), order);
        write_u16(buffer, static_cast<uint16_t>(value & 0xFFFF), order);
    } else {
        write_u16(buffer, static_cast<uint16_t>(value & 0xFFFF), order);
        write_u16(buffer, static_cast<uint16_t>(value >> 16), order);
    }
}

inline void write_u64(std::vector<uint8_t>& buffer, uint64_t value, byte_order order) {
    if (order == byte_order::big_endian) {
        write_u32(buffer, static_cast<uint32_t>(value >> 32), order);
        write_u32(buffer, static_cast<uint32_t>(value & 0xFFFFFFFF), order);
    } else {
        write_u32(buffer, static_cast<uint32_t>(value & 0xFFFFFFFF), order);
        write_u32(buffer, static_cast<uint32_t>(value >> 32), order);
    }
}

/// @}

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_BYTE_ORDER_HPP
