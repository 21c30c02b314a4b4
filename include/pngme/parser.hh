/**
 * @file parser.hh
 * @brief Functional helpers for walking chunk streams
 */

#pragma once

#include <cstddef>
#include <vector>

#include <pngme/chunk_iterator.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Call func for each chunk in a buffer with custom options
     *
     * A leading PNG signature is skipped, otherwise records are read from
     * the first byte.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param data Buffer holding a PNG file or bare concatenated records
     * @param size Buffer size
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const void* data, std::size_t size, Func func, const parse_options& options) {
        const std::size_t start = has_png_signature(data, size) ? png_signature.size() : 0;
        chunk_iterator it(data, size, start, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    /**
     * @brief Call func for each chunk in a buffer with default options
     */
    template<typename Func>
    void for_each_chunk(const void* data, std::size_t size, Func func) {
        for_each_chunk(data, size, func, parse_options{});
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func, const parse_options& options) {
        for_each_chunk(bytes.data(), bytes.size(), func, options);
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func) {
        for_each_chunk(bytes.data(), bytes.size(), func, parse_options{});
    }

} // namespace pngme
