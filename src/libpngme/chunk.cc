//
// Created by igor on 15/08/2025.
//

#include <algorithm>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/exceptions.hh>
#include "input.hh"
#include "utf8.hh"

namespace pngme {
    namespace {
        constexpr std::size_t header_size = 8;   // length + type
        constexpr std::size_t crc_size = 4;
        constexpr std::uint64_t length_field_offset = 0;

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        void check_size_limit(const parse_options& options, const chunk_type& type, std::uint32_t length) {
            if (length <= options.max_chunk_size) {
                return;
            }
            auto msg = build_error_msg("Chunk '", type, "' has declared length ", length,
                                       " bytes, which exceeds maximum allowed size of ",
                                       options.max_chunk_size, " bytes");
            if (options.strict) {
                throw chunk_too_large_error(msg);
            }
            warn(options, length_field_offset, "size_limit", msg);
        }

        void verify_crc(const chunk_type& type, const std::vector<std::byte>& data, std::uint32_t stored) {
            auto computed = chunk_crc(type, data);
            if (computed != stored) {
                throw checksum_mismatch_error(
                    build_error_msg("Chunk '", type, "': the provided CRC ", stored,
                                    " does not match the expected one ", computed),
                    computed, stored);
            }
        }
    }

    chunk::chunk(pngme::chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(chunk_crc(m_type, m_data)) {
    }

    chunk::chunk(pngme::chunk_type type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk::chunk(pngme::chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        THROW_PNGME_IF(size < overhead, truncated_input_error,
                       "Chunk frame needs at least ", overhead, " bytes, got ", size);

        memory_reader in(data, size);
        auto declared = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        check_size_limit(options, type, declared);

        // The declared length is authoritative in strict mode; lenient mode
        // takes everything between the type code and the trailing CRC.
        std::size_t available = size - overhead;
        std::size_t payload_size = declared;
        if (declared != available) {
            if (options.strict) {
                THROW_PNGME_IF(declared > available, truncated_input_error,
                               "Chunk '", type, "' declares ", declared, " payload bytes but the buffer holds only ",
                               available);
                THROW_PNGME(length_mismatch_error,
                            "Chunk '", type, "' declares ", declared, " payload bytes but the buffer holds ",
                            available, " (", available - declared, " trailing bytes)");
            }
            // Reported at the payload start, where the two extents diverge
            warn(options, in.tell(), "length_mismatch",
                 build_error_msg("Chunk '", type, "' declares ", declared, " payload bytes, using the ",
                                 available, " bytes before the CRC"));
            payload_size = available;
        }

        auto payload = in.read_exact(payload_size);
        auto stored = in.read<std::uint32_t>(byte_order::big);
        verify_crc(type, payload, stored);

        return chunk(type, std::move(payload), stored);
    }

    std::pair<chunk, std::size_t> chunk::read_frame(const void* data, std::size_t size, const parse_options& options) {
        THROW_PNGME_IF(size < overhead, truncated_input_error,
                       "Chunk frame needs at least ", overhead, " bytes, got ", size);

        memory_reader in(data, size);
        auto declared = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        check_size_limit(options, type, declared);

        THROW_PNGME_IF(in.remaining() - crc_size < declared, truncated_input_error,
                       "Chunk '", type, "' declares ", declared, " payload bytes but only ",
                       in.remaining() - crc_size, " remain before the CRC");

        auto payload = in.read_exact(declared);
        auto stored = in.read<std::uint32_t>(byte_order::big);
        verify_crc(type, payload, stored);

        return {chunk(type, std::move(payload), stored), in.tell()};
    }

    std::vector<std::byte> chunk::serialize() const {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::length_error(build_error_msg("Chunk '", m_type, "' payload of ", m_data.size(),
                                                    " bytes does not fit a 32-bit length field"));
        }

        std::vector<std::byte> out(frame_size());
        store_be32(out.data(), static_cast<std::uint32_t>(m_data.size()));
        m_type.to_bytes(out.data() + 4);
        std::copy(m_data.begin(), m_data.end(), out.begin() + header_size);
        store_be32(out.data() + header_size + m_data.size(), m_crc);
        return out;
    }

    void chunk::write_to(std::ostream& os) const {
        auto frame = serialize();
        os.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
        THROW_IO_IF(!os, "Failed to write ", frame.size(), " bytes of chunk '", m_type, "'");
    }

    std::string chunk::data_as_string() const {
        std::size_t bad = 0;
        THROW_PNGME_UNLESS(is_valid_utf8(m_data.data(), m_data.size(), bad), text_decode_error,
                           "Chunk '", m_type, "' payload is not valid UTF-8 (invalid sequence at byte ", bad, ")");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::string chunk::to_string() const {
        std::ostringstream os;
        os << "Chunk Type = " << m_type << ". Data = " << data_as_string()
           << ". Length = " << length() << ". CRC = " << m_crc;
        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.to_string();
    }
}
