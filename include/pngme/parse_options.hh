/**
 * @file parse_options.hh
 * @brief Parsing options for chunk streams and PNG files
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for iterating chunk streams
     *
     * Single chunk parsing (chunk::parse, chunk::parse_next) is always
     * strict; these options only govern how a stream of chunks reacts to a
     * malformed record and where notices are reported.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a malformed record throws parse_error.
         * When false, the warning handler receives the failure and
         * iteration stops before the malformed record.
         */
        bool strict = true;

        /**
         * @brief Report chunks that follow IEND
         *
         * Message chunks are appended after IEND, so tools that write them
         * turn this notice off.
         */
        bool warn_after_iend = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the record the warning is about
         * @param category Warning category (e.g., "reserved_bit", "crc_mismatch")
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
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
