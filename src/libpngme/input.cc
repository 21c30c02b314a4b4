//
// Bounds-checked cursors over memory buffers.
//

#include <algorithm>

#include "input.hh"

namespace pngme {
    reader::reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_IO_IF(data == nullptr && size != 0, "Null buffer of ", size, " bytes");
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    chunk_type reader::read_chunk_type() {
        std::array<std::uint8_t, chunk_type::size> data;
        std::size_t actual = read(data.data(), data.size());
        THROW_IO_IF(actual != data.size(), "Failed to read chunk type");
        return chunk_type(data);
    }

    void writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_UNLESS(src, "Null buffer in write");
        const auto* p = static_cast<const std::byte*>(src);
        m_out.insert(m_out.end(), p, p + size);
    }
}
