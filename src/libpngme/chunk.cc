//
// PNG chunk codec.
//

#include <ostream>
#include <stdexcept>

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

namespace pngme {

    namespace {
        // Offset of the first byte that breaks UTF-8, or size if the text is valid
        std::size_t find_invalid_utf8(const std::vector<std::byte>& data) {
            const std::size_t size = data.size();
            std::size_t i = 0;
            while (i < size) {
                const auto c = static_cast<std::uint8_t>(data[i]);
                std::size_t extra;
                std::uint32_t cp;
                if (c < 0x80) {
                    i++;
                    continue;
                } else if ((c & 0xE0) == 0xC0) {
                    extra = 1;
                    cp = c & 0x1F;
                } else if ((c & 0xF0) == 0xE0) {
                    extra = 2;
                    cp = c & 0x0F;
                } else if ((c & 0xF8) == 0xF0) {
                    extra = 3;
                    cp = c & 0x07;
                } else {
                    return i;
                }

                if (extra > size - i - 1) {
                    return i;
                }
                for (std::size_t k = 1; k <= extra; k++) {
                    const auto cc = static_cast<std::uint8_t>(data[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        return i;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }

                // overlong forms, UTF-16 surrogates, beyond U+10FFFF
                static constexpr std::uint32_t min_code_point[] = {0, 0x80, 0x800, 0x10000};
                if (cp < min_code_point[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                    return i;
                }
                i += extra + 1;
            }
            return size;
        }

        // Single validation path shared by parse and parse_next. A whole
        // buffer record must declare exactly the bytes between type and CRC,
        // a streamed one may be followed by further records.
        parsed_chunk decode(const void* data, std::size_t size, bool whole_buffer) {
            THROW_PARSE_IF(size < chunk::overhead, too_short,
                           "Chunk record needs at least ", chunk::overhead, " bytes, got ", size);

            reader in(data, size);
            const auto length = in.read_u32_be();
            const auto type = in.read_chunk_type();

            const std::size_t available = in.remaining() - chunk::crc_size;
            if (whole_buffer) {
                THROW_PARSE_IF(length != available, length_mismatch,
                               "Chunk ", type, " declares length ", length,
                               " but the record holds ", available, " bytes of data");
            } else {
                THROW_PARSE_IF(length > available, length_exceeds_buffer,
                               "Chunk ", type, " declares length ", length,
                               " but only ", available, " bytes are available for its data");
            }

            auto payload = in.read_exact(length);
            const auto stored_crc = in.read_u32_be();

            chunk result(type, std::move(payload));
            const auto computed_crc = result.crc();
            THROW_PARSE_IF(stored_crc != computed_crc, crc_mismatch,
                           "Chunk ", type, " has stored CRC ", stored_crc,
                           " but its contents hash to ", computed_crc);

            return {std::move(result), in.tell(), in.remaining()};
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)) {
        if (m_data.size() > max_data_size) {
            throw std::length_error(build_error_msg("Chunk ", m_type, " data of ", m_data.size(),
                                                    " bytes exceeds the maximum of ", max_data_size));
        }
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return std::move(decode(data, size, true).record);
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size());
    }

    parsed_chunk chunk::parse_next(const void* data, std::size_t size) {
        return decode(data, size, false);
    }

    parsed_chunk chunk::parse_next(const std::vector<std::byte>& bytes) {
        return parse_next(bytes.data(), bytes.size());
    }

    std::uint32_t chunk::crc() const {
        return crc32{}
            .update(m_type.bytes().data(), chunk_type::size)
            .update(m_data.data(), m_data.size())
            .get();
    }

    std::string chunk::data_as_text() const {
        const auto bad = find_invalid_utf8(m_data);
        THROW_PARSE_IF(bad != m_data.size(), invalid_encoding,
                       "Chunk ", m_type, " data is not valid UTF-8 (offending byte ",
                       static_cast<unsigned>(m_data[bad]), " at offset ", bad, ")");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(overhead + m_data.size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        writer w(out);
        w.write_u32_be(length());
        w.write(m_type);
        w.write(m_data.data(), m_data.size());
        w.write_u32_be(crc());
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << "chunk " << c.type() << " length=" << c.length() << " crc=" << c.crc();
    }

} // namespace pngme
