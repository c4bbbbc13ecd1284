/**
 * @file crc32.hh
 * @brief CRC-32/ISO-HDLC checksum used by PNG chunks
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <string_view>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class crc32
     * @brief Table driven CRC-32 (reflected polynomial 0xEDB88320)
     *
     * The lookup table is built once at compile time and is shared
     * read-only by every checksum computation.
     *
     * Incremental use:
     * @code
     *   auto state = crc32::init;
     *   state = crc32::update(state, type_bytes, 4);
     *   state = crc32::update(state, payload.data(), payload.size());
     *   auto crc = crc32::finalize(state);
     * @endcode
     */
    class PNGCHUNK_EXPORT crc32 {
    public:
        using table_type = std::array<std::uint32_t, 256>;

        static constexpr std::uint32_t polynomial = 0xEDB88320u;
        static constexpr std::uint32_t init = 0xFFFFFFFFu;
        static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

        /**
         * @brief Feed bytes into a running (non-finalized) CRC state
         * @param state Running state, starts at crc32::init
         * @param data Bytes to add
         * @param size Number of bytes
         * @return Updated running state
         */
        static std::uint32_t update(std::uint32_t state, const void* data, std::size_t size);

        static constexpr std::uint32_t finalize(std::uint32_t state) { return state ^ xor_out; }

        /**
         * @brief One-shot checksum of a buffer
         */
        static std::uint32_t compute(const void* data, std::size_t size) {
            return finalize(update(init, data, size));
        }

        static std::uint32_t compute(const std::vector<std::byte>& data) {
            return compute(data.data(), data.size());
        }

        static std::uint32_t compute(std::string_view text) {
            return compute(text.data(), text.size());
        }

        /**
         * @brief Access the process-wide lookup table
         */
        static const table_type& table();
    };

} // namespace pngchunk
