//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/byte_order.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Bounded cursor over a caller-owned byte range. Never outlives the call
    // that created it; anything kept past that is copied out.
    class memory_reader {
        public:
            memory_reader(const void* data, std::size_t size);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            // Convenience methods, throw truncated_input_error on short reads
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                THROW_PNGME_IF(remaining() < sizeof(T), truncated_input_error,
                               "Failed to read ", sizeof(T), " bytes at offset ", m_position,
                               ": only ", remaining(), " left");
                T value = load<T>(current(), bo);
                m_position += sizeof(T);
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
