/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC, as used by zlib and PNG) helpers
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngme/export_pngme.h>

namespace pngme {

    class chunk_type;

    /**
     * @brief Compute or continue a CRC-32 over a byte range
     * @param data Bytes to checksum (may be null when size is 0)
     * @param size Number of bytes
     * @param previous CRC of the preceding bytes, 0 to start a new checksum
     * @return Updated CRC-32
     */
    PNGME_EXPORT std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t previous = 0) noexcept;

    /**
     * @brief CRC-32 of a chunk: type code bytes followed by the payload
     */
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) noexcept;

    inline std::uint32_t chunk_crc(const chunk_type& type, const std::vector<std::byte>& data) noexcept {
        return chunk_crc(type, data.data(), data.size());
    }

} // namespace pngme
