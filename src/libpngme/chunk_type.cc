//
// Created by igor on 15/08/2025.
//

#include <algorithm>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {
    namespace {
        bool all_letters(const chunk_type::bytes_type& b) {
            return std::all_of(b.begin(), b.end(), chunk_type::is_letter);
        }

        std::string describe(const chunk_type::bytes_type& b) {
            std::ostringstream os;
            for (std::size_t i = 0; i < b.size(); i++) {
                os << (i ? ", " : "[") << static_cast<unsigned>(b[i]);
            }
            os << ']';
            return os.str();
        }
    }

    chunk_type::chunk_type(const bytes_type& bytes)
        : m_bytes(bytes) {
        THROW_PNGME_UNLESS(all_letters(m_bytes), invalid_chunk_type_error,
                           "Chunk type bytes ", describe(m_bytes),
                           " must be uppercase or lowercase letters");
    }

    chunk_type::chunk_type(char c0, char c1, char c2, char c3)
        : chunk_type(bytes_type{static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                                static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3)}) {
    }

    chunk_type::chunk_type(std::string_view sv)
        : chunk_type([sv] {
            THROW_PNGME_IF(sv.size() != 4, invalid_length_error,
                           "Chunk type string must have a 4-byte length, got ", sv.size(), " bytes");
            bytes_type b;
            std::copy_n(sv.begin(), 4, reinterpret_cast<char*>(b.data()));
            return b;
        }()) {
    }

    bool chunk_type::is_valid() const noexcept {
        return is_reserved_bit_valid() && all_letters(m_bytes);
    }
}
