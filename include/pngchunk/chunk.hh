/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, payload and checksum
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable PNG chunk
     *
     * Wire layout (all integers big-endian):
     * @code
     *   length(u32) type(4 bytes) data(length bytes) crc(u32)
     * @endcode
     * The crc covers the type and data bytes. A constructed chunk always
     * satisfies length() == data().size() and crc() == crc32(type ++ data).
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Bytes taken by length, type and crc fields
        static constexpr std::size_t overhead = 12;

        /// Largest payload a u32 length field can describe
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Create a chunk and compute its checksum
         * @param type Chunk type
         * @param data Payload bytes
         * @throws codec_error(length) if the payload does not fit a u32 length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk holding text
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one encoded chunk
         * @param data Encoded chunk, exactly length + 12 bytes
         * @param size Buffer size
         * @return Decoded chunk
         * @throws codec_error with kind length, type or crc
         */
        static chunk decode(const std::byte* data, std::size_t size);

        static chunk decode(const std::vector<std::byte>& data) {
            return decode(data.data(), data.size());
        }

        /**
         * @brief Serialize to wire format; exact inverse of decode()
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Append the wire format to an existing buffer
         */
        void encode_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::size_t encoded_size() const { return m_data.size() + overhead; }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Payload as UTF-8 text
         * @throws codec_error(data) if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

        /**
         * @brief Checksum of type ++ data
         */
        static std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief Print as "length type data crc"
     *
     * Payloads that are not UTF-8 are printed as hex bytes.
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
