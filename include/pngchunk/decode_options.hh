/**
 * @file decode_options.hh
 * @brief Decoding options for PNG containers
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct decode_options
     * @brief Configuration options for decoding PNG containers
     *
     * The defaults reject every malformed input. Relaxed settings report
     * the problem through on_warning instead of throwing.
     */
    struct decode_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, trailing bytes that do not form a complete chunk fail
         * with error_kind::length. When false they are reported as a
         * "trailing_data" warning and dropped.
         */
        bool strict = true;

        /**
         * @brief Verify chunk checksums
         *
         * When false, a mismatch is reported as a "crc_mismatch" warning and
         * the chunk is kept with a freshly computed checksum.
         */
        bool verify_crc = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Declared lengths above this fail with error_kind::length.
         * Default is chunk::max_length, so every chunk that can be created
         * also decodes inside a container.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category ("trailing_data", "crc_mismatch")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
