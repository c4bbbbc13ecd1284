/**
 * @file chunk_header.hh
 * @brief Chunk header structure for PNG containers
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <cstdint>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @struct chunk_header
     * @brief Position and framing of a chunk inside a container image
     */
    struct chunk_header {
        chunk_type type;                   ///< Chunk type
        std::uint32_t length = 0;         ///< Data length in bytes
        std::uint64_t file_offset = 0;    ///< Offset of the length field in the buffer
        std::uint32_t crc = 0;            ///< Checksum as stored in the buffer
    };

} // namespace pngchunk
