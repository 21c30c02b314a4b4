//
// Forward-only chunk stream iterator.
//

#include <cstring>
#include <stdexcept>

#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    bool has_png_signature(const void* data, std::size_t size) {
        return data != nullptr && size >= png_signature.size() &&
               std::memcmp(data, png_signature.data(), png_signature.size()) == 0;
    }

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, std::size_t start_offset)
        : chunk_iterator(data, size, start_offset, parse_options{}) {
    }

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, std::size_t start_offset,
                                   const parse_options& options)
        : m_data(static_cast<const std::byte*>(data))
        , m_size(size)
        , m_offset(start_offset)
        , m_options(options) {
        THROW_IO_IF(data == nullptr && size != 0, "Null buffer of ", size, " bytes");
        THROW_IO_IF(start_offset > size, "Start offset ", start_offset,
                    " is beyond the end of a ", size, " byte buffer");

        m_ended = !read_next_chunk();
    }

    const chunk_iterator::chunk_info& chunk_iterator::current() const {
        if (m_ended || !m_current) {
            throw std::out_of_range("chunk_iterator::current() called at end of stream");
        }
        return *m_current;
    }

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        if (!read_next_chunk()) {
            m_ended = true;
            m_current.reset();
        }
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_offset >= m_size) {
            return false;
        }

        try {
            auto parsed = chunk::parse_next(m_data + m_offset, m_size - m_offset);
            const auto& type = parsed.record.type();

            if (!type.is_valid()) {
                warn(m_offset, "reserved_bit",
                     build_error_msg("Chunk ", type, " at offset ", m_offset,
                                     " has a lowercase third letter (reserved bit set)"));
            }
            if (m_seen_iend && m_options.warn_after_iend) {
                warn(m_offset, "after_iend",
                     build_error_msg("Chunk ", type, " at offset ", m_offset, " follows IEND"));
            }
            if (type == chunk_types::IEND) {
                m_seen_iend = true;
            }

            m_current = chunk_info{std::move(parsed.record), m_offset, m_index};
            m_offset += parsed.consumed;
            m_index++;
            return true;

        } catch (const parse_error& e) {
            if (m_options.strict) {
                throw;
            }
            warn(m_offset, to_string(e.kind()), e.what());
            return false;
        }
    }

    void chunk_iterator::warn(std::size_t offset, std::string_view category, std::string_view message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngme
