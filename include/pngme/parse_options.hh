/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk frames
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunk frames
     *
     * Controls strictness, size limits, and warning handling.
     * Checksum verification is always performed regardless of these options.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a declared length that disagrees with the buffer
         * extent, or exceeds max_chunk_size, fails the parse.
         * When false, the payload is taken to be everything between the
         * type code and the trailing CRC, and a warning is reported.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed declared chunk length in bytes
         *
         * PNG limits chunk lengths to 2^31 - 1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset inside the parsed frame where the issue was found:
         *               0 (length field) for "size_limit", 8 (payload start)
         *               for "length_mismatch"
         * @param category Warning category ("size_limit", "length_mismatch")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues in lenient mode.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
