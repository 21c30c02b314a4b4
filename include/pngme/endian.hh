/**
 * @file endian.hh
 * @brief Platform endianness and conversion to network byte order
 */

#pragma once

#include <cstdint>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if PNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    /**
     * @brief Convert between host and big-endian order
     *
     * Every PNG integer field is a big-endian 32 bit value. The conversion
     * is its own inverse, so it serves reading and writing alike.
     */
    inline std::uint32_t big_endian32(std::uint32_t x) {
        if constexpr (is_big_endian) {
            return x;
        } else {
            return swap32(x);
        }
    }
}
