/**
 * @file parser.hh
 * @brief Functional helpers for walking PNG chunks
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <vector>
#include <cstddef>
#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @brief Call func for each chunk in the stream, with custom options
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param data Whole PNG byte stream
     * @param func Function to call for each chunk
     * @param options Decoding options
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& data, Func func, const decode_options& options) {
        chunk_iterator it(data, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    /**
     * @brief Call func for each chunk in the stream
     *
     * Uses default decode options.
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& data, Func func) {
        for_each_chunk(data, func, decode_options{});
    }

} // namespace pngchunk
