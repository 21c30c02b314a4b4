//
// Table-driven CRC-32, see the "Sample CRC Code" appendix of the PNG
// specification.
//

#include <pngme/crc.hh>

namespace pngme {

    namespace {
        constexpr std::uint32_t table_entry(std::uint32_t n) {
            std::uint32_t c = n;
            for (int k = 0; k < 8; k++) {
                if (c & 1) {
                    c = crc32::polynomial ^ (c >> 1);
                } else {
                    c = c >> 1;
                }
            }
            return c;
        }

        constexpr std::array<std::uint32_t, 256> make_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t n = 0; n < 256; n++) {
                table[n] = table_entry(n);
            }
            return table;
        }

        constexpr std::array<std::uint32_t, 256> s_table = make_table();

        static_assert(s_table[1] == 0x77073096u, "CRC-32 table generation is broken");
        static_assert(s_table[255] == 0x2D02EF8Du, "CRC-32 table generation is broken");
    }

    crc32 crc32::update_byte(std::uint8_t byte) const noexcept {
        std::uint32_t index = (m_state ^ byte) & 0xFFu;
        return crc32(s_table[index] ^ (m_state >> 8));
    }

    crc32 crc32::update(const void* data, std::size_t size) const noexcept {
        const auto* p = static_cast<const std::uint8_t*>(data);
        crc32 result = *this;
        for (std::size_t i = 0; i < size; i++) {
            result = result.update_byte(p[i]);
        }
        return result;
    }

    const std::array<std::uint32_t, 256>& crc32_table() noexcept {
        return s_table;
    }

    std::uint32_t crc32_of(const void* data, std::size_t size) noexcept {
        return crc32{}.update(data, size).get();
    }

} // namespace pngme
