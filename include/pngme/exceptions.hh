/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * This file defines the exception hierarchy, the closed set of validation
 * failure kinds and convenience macros for error handling throughout the
 * library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Category of a validation failure
     *
     * Callers branch on the kind instead of inspecting message text.
     */
    enum class error_kind {
        invalid_character,     ///< Non-letter byte in a chunk type tag
        wrong_length,          ///< Chunk type string is not exactly 4 bytes
        too_short,             ///< Buffer too small to hold a record
        length_mismatch,       ///< Declared length differs from the payload slice (whole-buffer parse)
        length_exceeds_buffer, ///< Declared length reads past the available bytes (streaming parse)
        trailing_data,         ///< Bytes left over after a record; chunk::parse reports them as length_mismatch
        crc_mismatch,          ///< Stored CRC differs from the recomputed one
        invalid_encoding,      ///< Payload is not valid UTF-8 text
        invalid_signature,     ///< Buffer does not start with the PNG signature
        chunk_not_found        ///< No chunk of the requested type
    };

    /**
     * @brief Stable category name of an error kind
     * @param kind Error kind
     * @return Lowercase name, e.g. "crc_mismatch"
     */
    PNGME_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngme-specific errors with a single catch block.
     */
    class PNGME_EXPORT pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when opening, reading or writing a file or stream fails.
     */
    class PNGME_EXPORT io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for validation failures
     *
     * Thrown when a chunk type, a chunk record or a PNG file violates the
     * format. The kind tells which rule was broken.
     */
    class PNGME_EXPORT parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngme_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     * @param kind Enumerator name of ::pngme::error_kind
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngme::parse_error(::pngme::error_kind::kind, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
