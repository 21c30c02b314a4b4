/**
 * @file crc.hh
 * @brief CRC-32 as used by PNG (ISO 3309, reflected polynomial 0xEDB88320)
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class crc32
     * @brief Incremental CRC-32 accumulator
     *
     * The stored accumulator is the complement of the running CRC. Every
     * update returns a new state and leaves this one untouched, so a
     * partially fed state can be branched. Byte order matters: the same
     * bytes must be fed in the same order when writing and verifying.
     *
     * @code
     * auto crc = crc32{}.update(type, 4).update(data, size).get();
     * @endcode
     */
    class PNGME_EXPORT crc32 {
    public:
        using value_type = std::uint32_t;

        static constexpr value_type polynomial = 0xEDB88320u;

        /**
         * @brief Fresh accumulator (all bits set)
         */
        constexpr crc32() = default;

        [[nodiscard]] crc32 update_byte(std::uint8_t byte) const noexcept;

        /**
         * @brief Feed a run of bytes, left to right
         * @param data Bytes to feed (may be null when size is 0)
         * @param size Number of bytes
         */
        [[nodiscard]] crc32 update(const void* data, std::size_t size) const noexcept;

        /**
         * @brief Externally visible CRC of everything fed so far
         */
        [[nodiscard]] constexpr value_type get() const noexcept { return ~m_state; }

        bool operator==(const crc32& o) const noexcept { return m_state == o.m_state; }
        bool operator!=(const crc32& o) const noexcept { return !(*this == o); }

    private:
        constexpr explicit crc32(value_type state) : m_state(state) {}

        value_type m_state = 0xFFFFFFFFu;
    };

    /**
     * @brief The 256-entry lookup table used by crc32
     */
    PNGME_EXPORT const std::array<std::uint32_t, 256>& crc32_table() noexcept;

    /**
     * @brief One-shot CRC-32 of a byte run
     */
    PNGME_EXPORT std::uint32_t crc32_of(const void* data, std::size_t size) noexcept;

} // namespace pngme
