/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every exception carries an
 * ::pngme::error_kind so front-ends can report the failure category
 * without matching on message text.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Category of a library failure
     */
    enum class error_kind {
        io,                 ///< Output stream failure
        parse,              ///< Generic malformed input
        invalid_length,     ///< Type-code text is not exactly 4 bytes
        invalid_chunk_type, ///< Type-code byte is not an ASCII letter
        truncated_input,    ///< Buffer too short for the chunk frame
        length_mismatch,    ///< Declared length disagrees with the buffer extent
        chunk_too_large,    ///< Declared length exceeds the configured maximum
        checksum_mismatch,  ///< Stored CRC-32 differs from the recomputed one
        text_decode         ///< Payload is not valid UTF-8
    };

    /**
     * @brief Stable name of an error kind, suitable for diagnostics
     */
    PNGME_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class pngme_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all chunk-related errors with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when writing a serialized chunk to a stream fails.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_kind::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for parsing errors
     *
     * Base of every error raised while validating a type code or a
     * chunk frame.
     */
    class parse_error : public pngme_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngme_error(error_kind::parse, msg) {}

    protected:
        parse_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    class invalid_length_error : public parse_error {
    public:
        explicit invalid_length_error(const std::string& msg)
            : parse_error(error_kind::invalid_length, msg) {}
    };

    class invalid_chunk_type_error : public parse_error {
    public:
        explicit invalid_chunk_type_error(const std::string& msg)
            : parse_error(error_kind::invalid_chunk_type, msg) {}
    };

    class truncated_input_error : public parse_error {
    public:
        explicit truncated_input_error(const std::string& msg)
            : parse_error(error_kind::truncated_input, msg) {}
    };

    class length_mismatch_error : public parse_error {
    public:
        explicit length_mismatch_error(const std::string& msg)
            : parse_error(error_kind::length_mismatch, msg) {}
    };

    class chunk_too_large_error : public parse_error {
    public:
        explicit chunk_too_large_error(const std::string& msg)
            : parse_error(error_kind::chunk_too_large, msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief The CRC stored in a frame does not match its contents
     */
    class checksum_mismatch_error : public parse_error {
    public:
        checksum_mismatch_error(const std::string& msg, std::uint32_t expected, std::uint32_t actual)
            : parse_error(error_kind::checksum_mismatch, msg)
            , m_expected(expected)
            , m_actual(actual) {}

        /// CRC computed over the type code and payload
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC found in the frame
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class text_decode_error
     * @brief Payload requested as text is not valid UTF-8
     */
    class text_decode_error : public pngme_error {
    public:
        explicit text_decode_error(const std::string& msg)
            : pngme_error(error_kind::text_decode, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PNGME
     * @brief Throw a library exception of the given class with formatted message
     * @param type Exception class name inside namespace pngme
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PNGME(type, ...) \
        throw ::pngme::type(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PNGME_IF
     * @brief Conditionally throw a library exception
     * @param condition Condition to check
     * @param type Exception class name inside namespace pngme
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_PNGME_IF(condition, type, ...) \
        do { if (condition) THROW_PNGME(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PNGME_UNLESS
     * @brief Throw a library exception unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param type Exception class name inside namespace pngme
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_PNGME_UNLESS(condition, type, ...) \
        do { if (!(condition)) THROW_PNGME(type, __VA_ARGS__); } while(0)

    #define THROW_IO_IF(condition, ...) THROW_PNGME_IF(condition, io_error, __VA_ARGS__)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
