/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type code, payload and CRC-32
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief Immutable, checksummed PNG chunk record
     *
     * Frame layout, all integers big endian:
     * @code
     *   offset 0          length      (4 bytes)
     *   offset 4          type code   (4 bytes)
     *   offset 8          payload     (length bytes)
     *   offset 8+length   CRC-32      (4 bytes, over type code + payload)
     * @endcode
     *
     * A chunk owns a copy of its payload. The CRC always matches the type
     * code and payload: chunks are either built from them, or parsed from
     * a frame whose stored CRC was verified.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from a type code and an arbitrary payload
         * @param type Chunk type code
         * @param data Payload bytes, may be empty
         */
        chunk(pngme::chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk carrying text
         * @param type Chunk type code
         * @param text Payload bytes, copied verbatim
         */
        chunk(pngme::chunk_type type, std::string_view text);

        /**
         * @brief Parse exactly one chunk frame
         * @param data Start of the frame
         * @param size Size of the frame in bytes
         * @param options Strictness, size limit and warning callback
         * @return Parsed chunk with its payload copied out of @p data
         *
         * @throws truncated_input_error   buffer shorter than 12 bytes, or shorter
         *                                 than the declared length requires (strict)
         * @throws length_mismatch_error   buffer longer than the declared length (strict)
         * @throws chunk_too_large_error   declared length above options.max_chunk_size (strict)
         * @throws invalid_chunk_type_error type code is not four ASCII letters
         * @throws checksum_mismatch_error stored CRC differs from the computed one
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);

        static chunk parse(const void* data, std::size_t size) {
            return parse(data, size, parse_options{});
        }

        static chunk parse(const std::vector<std::byte>& frame, const parse_options& options = parse_options{}) {
            return parse(frame.data(), frame.size(), options);
        }

        static chunk parse(const std::vector<std::uint8_t>& frame, const parse_options& options = parse_options{}) {
            return parse(frame.data(), frame.size(), options);
        }

        /**
         * @brief Parse the chunk frame at the front of a longer buffer
         * @param data Start of the frame
         * @param size Bytes available from @p data onward
         * @param options Only max_chunk_size, strict and on_warning for the size limit apply
         * @return The chunk and the number of bytes its frame occupies
         *
         * The declared length delimits the frame; bytes past it are left
         * for the caller. Throws the same errors as parse(), except
         * length_mismatch_error.
         */
        static std::pair<chunk, std::size_t> read_frame(const void* data, std::size_t size,
                                                        const parse_options& options = parse_options{});

        /**
         * @brief Serialize to the on-disk frame layout
         * @throws std::length_error if the payload does not fit the 32-bit length field
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Write the serialized frame to a stream
         * @throws io_error if the stream rejects the write
         */
        void write_to(std::ostream& os) const;

        [[nodiscard]] std::size_t length() const noexcept { return m_data.size(); }
        [[nodiscard]] const pngme::chunk_type& chunk_type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /// Total bytes occupied by the serialized frame
        [[nodiscard]] std::size_t frame_size() const noexcept { return overhead + m_data.size(); }

        /**
         * @brief Payload decoded as UTF-8 text
         * @throws text_decode_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Human readable rendering: type, text, length and CRC
         * @throws text_decode_error for payloads that are not UTF-8 text
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(pngme::chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        pngme::chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    // Stream output, same text as chunk::to_string()
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
