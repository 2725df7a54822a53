//
// Created by igor on 12/08/2025.
//

#include "input.hh"

namespace pngme {
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data))
        , m_size(size)
        , m_position(0) {
        THROW_PNGME_IF(data == nullptr && size > 0, parse_error, "Null buffer of size ", size);
    }

    std::vector<std::byte> memory_reader::read_exact(std::size_t size) {
        THROW_PNGME_IF(remaining() < size, truncated_input_error,
                       "Unexpected end of buffer: requested ", size, " bytes at offset ",
                       m_position, ", got ", remaining());
        std::vector<std::byte> buffer(current(), current() + size);
        m_position += size;
        return buffer;
    }

    chunk_type memory_reader::read_chunk_type() {
        THROW_PNGME_IF(remaining() < 4, truncated_input_error,
                       "Failed to read chunk type at offset ", m_position);
        auto type = chunk_type::from_bytes(current());
        m_position += 4;
        return type;
    }
}
