//
// Created by igor on 15/08/2025.
//

#include <zlib.h>

#include <pngme/crc.hh>
#include <pngme/chunk_type.hh>

namespace pngme {
    std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t previous) noexcept {
        if (size == 0) {
            return previous;
        }
        return static_cast<std::uint32_t>(
            ::crc32_z(previous, static_cast<const Bytef*>(data), static_cast<z_size_t>(size)));
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) noexcept {
        auto crc = crc32(type.bytes().data(), type.bytes().size());
        return crc32(data, size, crc);
    }
}
