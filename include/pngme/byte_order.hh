/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for PNG chunk fields
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngme/endian.hh>

namespace pngme {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Decode an unsigned integer stored in the given byte order
     * @param src Pointer to at least sizeof(T) bytes
     */
    template<typename T>
    T load(const void* src, byte_order bo) noexcept {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if (!byte_order_native(bo)) {
            value = swap_byte_order(value);
        }
        return value;
    }

    /**
     * @brief Encode an unsigned integer in the given byte order
     * @param dst Pointer to at least sizeof(T) writable bytes
     */
    template<typename T>
    void store(void* dst, T value, byte_order bo) noexcept {
        if (!byte_order_native(bo)) {
            value = swap_byte_order(value);
        }
        std::memcpy(dst, &value, sizeof(T));
    }

    inline void store_be32(void* dst, std::uint32_t value) noexcept {
        store<std::uint32_t>(dst, value, byte_order::big);
    }
}
