/**
 * @file chunk.hh
 * @brief PNG chunk record: codec between (type, payload) and wire bytes
 *
 * Wire layout, all integers big-endian:
 *
 * @verbatim
 *   offset  size  field
 *   0       4     length of the payload
 *   4       4     chunk type
 *   8       len   payload
 *   8+len   4     CRC-32 over type and payload
 * @endverbatim
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/chunk_type.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    struct parsed_chunk;

    /**
     * @class chunk
     * @brief A chunk type plus its payload
     *
     * The CRC is never stored; crc() and serialize() always recompute it
     * from the current type and payload. Parsing is all-or-nothing: either a
     * fully validated chunk is returned or a parse_error is thrown.
     */
    class PNGME_EXPORT chunk {
    public:
        static constexpr std::size_t length_size = 4;
        static constexpr std::size_t crc_size = 4;

        /// Length field + type + CRC: the size of a record with empty payload
        static constexpr std::size_t overhead = length_size + chunk_type::size + crc_size;

        /// Largest payload whose length, together with the type, still fits 32 bits
        static constexpr std::size_t max_data_size = 0xFFFFFFFFu - chunk_type::size;

        /**
         * @brief Construct from a trusted type and payload
         * @throws std::length_error if data exceeds max_data_size
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Construct a chunk whose payload is the bytes of a text
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Parse exactly one record occupying the whole buffer
         * @param data Record bytes
         * @param size Buffer size
         * @return Validated chunk
         * @throws parse_error too_short, invalid_character, length_mismatch
         *         (also for bytes after the record) or crc_mismatch
         */
        static chunk parse(const void* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& bytes);

        /**
         * @brief Parse the record at the start of a buffer, leaving the rest
         * @param data Buffer holding one or more records
         * @param size Buffer size
         * @return Chunk and the number of bytes it occupied
         * @throws parse_error too_short, invalid_character,
         *         length_exceeds_buffer or crc_mismatch
         */
        static parsed_chunk parse_next(const void* data, std::size_t size);
        static parsed_chunk parse_next(const std::vector<std::byte>& bytes);

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        [[nodiscard]] std::uint32_t length() const {
            return static_cast<std::uint32_t>(m_data.size());
        }

        /**
         * @brief CRC-32 over the type bytes followed by the payload
         */
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Payload decoded as UTF-8 text
         * @throws parse_error invalid_encoding
         */
        [[nodiscard]] std::string data_as_text() const;

        /**
         * @brief Canonical wire bytes, 12 + length() in size
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Append the wire bytes to an existing buffer
         */
        void serialize_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    /**
     * @brief One-line summary: type, length and CRC
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @struct parsed_chunk
     * @brief Result of chunk::parse_next
     */
    struct parsed_chunk {
        chunk record;            ///< The validated chunk
        std::size_t consumed;    ///< Bytes occupied by the record (12 + length)
        std::size_t remaining;   ///< Bytes left after the record, starting at data + consumed
    };

} // namespace pngme
