/**
 * @file chunk_iterator.hh
 * @brief Forward-only iteration over concatenated chunk records
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    /// The 8 bytes every PNG file starts with
    inline constexpr std::array<std::uint8_t, 8> png_signature{137, 80, 78, 71, 13, 10, 26, 10};

    /**
     * @brief Check whether a buffer starts with the PNG signature
     */
    PNGME_EXPORT bool has_png_signature(const void* data, std::size_t size);

    /**
     * @class chunk_iterator
     * @brief Walks a memory buffer record by record using chunk::parse_next
     *
     * The buffer is borrowed and must outlive the iterator. The first record
     * is read on construction.
     *
     * @code
     * pngme::chunk_iterator it(bytes.data(), bytes.size(), 8);
     * while (it.has_next()) {
     *     std::cout << it.current().record << "\n";
     *     it.next();
     * }
     * @endcode
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk record;           ///< The validated chunk
            std::size_t offset;     ///< Offset of the record's length field in the buffer
            std::size_t index;      ///< Position in the stream (0 = first record)
        };

        /**
         * @brief Iterate records starting at start_offset with default options
         * @throws parse_error if the first record is malformed
         */
        chunk_iterator(const void* data, std::size_t size, std::size_t start_offset = 0);

        /**
         * @brief Iterate records starting at start_offset
         * @param data Buffer holding concatenated records
         * @param size Buffer size
         * @param start_offset Offset of the first record (8 to skip a PNG signature)
         * @param options Strictness and warning handler
         */
        chunk_iterator(const void* data, std::size_t size, std::size_t start_offset,
                       const parse_options& options);

        /**
         * @brief Get current chunk information
         * @throws std::out_of_range when the iterator is at its end
         */
        const chunk_info& current() const;

        /**
         * @brief Advance to the next chunk
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

        /**
         * @brief Offset of the first byte not consumed by a valid record
         */
        std::size_t offset() const { return m_offset; }

    private:
        void advance();
        bool read_next_chunk();
        void warn(std::size_t offset, std::string_view category, std::string_view message) const;

        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_offset;
        std::size_t m_index = 0;
        bool m_seen_iend = false;
        bool m_ended = true;
        std::optional<chunk_info> m_current;
        parse_options m_options;
    };

} // namespace pngme
