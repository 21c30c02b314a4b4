/**
 * @file png_file.hh
 * @brief PNG file as a signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class png_file
     * @brief Chunk level view of a PNG file
     *
     * Chunks are kept as parsed; no image data is decoded. Serializing an
     * unmodified file reproduces its bytes exactly.
     */
    class PNGME_EXPORT png_file {
    public:
        png_file() = default;
        explicit png_file(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG file held in memory
         * @throws parse_error too_short or invalid_signature for a bad
         *         signature, or any chunk parse error in strict mode
         */
        static png_file parse(const void* data, std::size_t size);
        static png_file parse(const void* data, std::size_t size, const parse_options& options);
        static png_file parse(const std::vector<std::byte>& bytes);
        static png_file parse(const std::vector<std::byte>& bytes, const parse_options& options);

        /**
         * @brief Read a whole stream and parse it
         * @throws io_error if the stream cannot be read
         */
        static png_file load(std::istream& stream);
        static png_file load(std::istream& stream, const parse_options& options);

        /**
         * @brief Read a file from disk and parse it
         * @throws io_error if the file cannot be opened or read
         */
        static png_file load(const std::filesystem::path& path);
        static png_file load(const std::filesystem::path& path, const parse_options& options);

        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const;
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        void append_chunk(chunk c);

        /**
         * @brief Remove and return the first chunk of the given type
         * @throws parse_error chunk_not_found
         */
        chunk remove_first_chunk(const chunk_type& type);

        /**
         * @brief First chunk of the given type, or nullptr
         */
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @throws io_error if writing fails
         */
        void save(std::ostream& stream) const;
        void save(const std::filesystem::path& path) const;

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngme
