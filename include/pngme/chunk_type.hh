/**
 * @file chunk_type.hh
 * @brief Four-letter PNG chunk type tag
 *
 * The case of each letter carries one property bit:
 *
 *   byte 0  uppercase = critical          lowercase = ancillary
 *   byte 1  uppercase = public            lowercase = private
 *   byte 2  uppercase = reserved bit ok   lowercase = invalid
 *   byte 3  lowercase = safe to copy      uppercase = unsafe to copy
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <string>
#include <string_view>
#include <ostream>

#include <pngme/exceptions.hh>
#include <pngme/export_pngme.h>

namespace pngme {
    class chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        static constexpr std::size_t size = 4;

        // Throws parse_error(invalid_character) unless all four are ASCII letters
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                       static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {
            validate();
        }

        constexpr explicit chunk_type(const bytes_type& bytes)
            : m_bytes(bytes) {
            validate();
        }

        /**
         * @brief Parse a user supplied tag
         * @param s Tag text, must be exactly 4 bytes long
         * @throws parse_error wrong_length or invalid_character
         */
        PNGME_EXPORT static chunk_type from_string(std::string_view s);

        /**
         * @brief Construct from 4 raw bytes (e.g. the type field of a record)
         * @throws parse_error invalid_character
         */
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, size);
            return chunk_type(bytes);
        }

        [[nodiscard]] constexpr const bytes_type& bytes() const { return m_bytes; }

        [[nodiscard]] constexpr bool is_critical() const { return is_upper(m_bytes[0]); }
        [[nodiscard]] constexpr bool is_public() const { return is_upper(m_bytes[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(m_bytes[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return is_lower(m_bytes[3]); }

        // Only the reserved bit decides validity, the others are informative
        [[nodiscard]] constexpr bool is_valid() const { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        [[nodiscard]] std::uint32_t to_uint32() const {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            os << '\'';
            for (auto c : t.m_bytes) {
                os << static_cast<char>(c);
            }
            return os << '\'';
        }

    private:
        static constexpr bool is_upper(std::uint8_t c) { return c >= 'A' && c <= 'Z'; }
        static constexpr bool is_lower(std::uint8_t c) { return c >= 'a' && c <= 'z'; }

        constexpr void validate() const {
            for (std::size_t i = 0; i < size; i++) {
                if (!is_upper(m_bytes[i]) && !is_lower(m_bytes[i])) {
                    THROW_PARSE(invalid_character, "Chunk type byte ", i, " has value ",
                                static_cast<unsigned>(m_bytes[i]),
                                ", chunk types must consist of ASCII letters");
                }
            }
        }

        bytes_type m_bytes;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // "RuSt"_chunk
    constexpr chunk_type operator""_chunk(const char* str, std::size_t len) {
        if (len != chunk_type::size) {
            THROW_PARSE(wrong_length, "Chunk type literal must be 4 characters, got ", len);
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Chunk types defined by the PNG specification
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');

        inline constexpr chunk_type tRNS('t', 'R', 'N', 'S');
        inline constexpr chunk_type cHRM('c', 'H', 'R', 'M');
        inline constexpr chunk_type gAMA('g', 'A', 'M', 'A');
        inline constexpr chunk_type iCCP('i', 'C', 'C', 'P');
        inline constexpr chunk_type sBIT('s', 'B', 'I', 'T');
        inline constexpr chunk_type sRGB('s', 'R', 'G', 'B');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
        inline constexpr chunk_type bKGD('b', 'K', 'G', 'D');
        inline constexpr chunk_type hIST('h', 'I', 'S', 'T');
        inline constexpr chunk_type pHYs('p', 'H', 'Y', 's');
        inline constexpr chunk_type sPLT('s', 'P', 'L', 'T');
        inline constexpr chunk_type tIME('t', 'I', 'M', 'E');
    }

}

namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
