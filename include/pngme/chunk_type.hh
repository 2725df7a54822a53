//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <ostream>

#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Four-letter PNG chunk type code
     *
     * Every byte is an ASCII letter. Bit 5 (the lowercase bit) of each byte
     * carries a property flag:
     *  - byte 0: ancillary (set) / critical (clear)
     *  - byte 1: private (set) / public (clear)
     *  - byte 2: reserved, must be clear in conforming files
     *  - byte 3: safe to copy (set) / unsafe to copy (clear)
     *
     * A code whose reserved bit is set is still constructible, but is_valid()
     * reports false.
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        // Throws invalid_chunk_type_error unless all bytes are ASCII letters
        explicit chunk_type(const bytes_type& bytes);

        chunk_type(char c0, char c1, char c2, char c3);

        // Throws invalid_length_error unless sv is exactly 4 bytes,
        // then applies the same letter check as the byte constructor
        explicit chunk_type(std::string_view sv);

        explicit chunk_type(const std::string& str) : chunk_type(std::string_view(str)) {}

        // A null pointer is treated as an empty string
        explicit chunk_type(const char* str) : chunk_type(str ? std::string_view(str) : std::string_view()) {}

        // Constructor from raw bytes, same validation as the array form
        static chunk_type from_bytes(const void* data) {
            bytes_type b;
            std::memcpy(b.data(), data, 4);
            return chunk_type(b);
        }

        [[nodiscard]] const bytes_type& bytes() const noexcept { return m_bytes; }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const noexcept {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Write to bytes
        void to_bytes(void* dest) const noexcept {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] bool is_critical() const noexcept { return !property_bit(0); }
        [[nodiscard]] bool is_public() const noexcept { return !property_bit(1); }
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return !property_bit(2); }
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return property_bit(3); }

        /// Letters only and reserved bit clear
        [[nodiscard]] bool is_valid() const noexcept;

        static bool is_letter(std::uint8_t c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const noexcept { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const noexcept { return !(*this == o); }
        bool operator<(const chunk_type& o) const noexcept { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string_view();
        }

    private:
        static constexpr std::uint8_t property_mask = 0x20;

        [[nodiscard]] bool property_bit(std::size_t i) const noexcept {
            return (m_bytes[i] & property_mask) != 0;
        }

        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Chunk types defined by the PNG specification
    namespace chunk_types {
        inline const chunk_type IHDR("IHDR");
        inline const chunk_type PLTE("PLTE");
        inline const chunk_type IDAT("IDAT");
        inline const chunk_type IEND("IEND");
        inline const chunk_type tEXt("tEXt");
        inline const chunk_type zTXt("zTXt");
        inline const chunk_type iTXt("iTXt");
        inline const chunk_type tIME("tIME");
        inline const chunk_type gAMA("gAMA");
        inline const chunk_type pHYs("pHYs");
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
