//
// Bounds-checked cursors over memory buffers.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Reads from a borrowed buffer; the buffer must outlive the reader
    class reader {
        public:
            reader(const void* data, std::size_t size);

            // Copies up to size bytes, returns the number copied
            std::size_t read(void* dst, std::size_t size);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            std::vector<std::byte> read_exact(std::size_t size) {
                THROW_IO_IF(size > remaining(), "Unexpected end of buffer: requested ", size,
                            " bytes, ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            // Reads a big-endian 32 bit field
            std::uint32_t read_u32_be() {
                std::uint32_t value;
                std::size_t actual = read(&value, sizeof(value));
                THROW_IO_IF(actual != sizeof(value), "Failed to read ", sizeof(value), " bytes");
                return big_endian32(value);
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Appends to a caller owned byte vector
    class writer {
        public:
            explicit writer(std::vector<std::byte>& out) : m_out(out) {}

            void write(const void* src, std::size_t size);

            void write_u32_be(std::uint32_t value) {
                value = big_endian32(value);
                write(&value, sizeof(value));
            }

            void write(const chunk_type& type) {
                write(type.bytes().data(), chunk_type::size);
            }

        private:
            std::vector<std::byte>& m_out;
    };
}
