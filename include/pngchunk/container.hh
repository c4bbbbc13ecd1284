/**
 * @file container.hh
 * @brief PNG container: signature followed by an ordered list of chunks
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <pngchunk/chunk.hh>
#include <pngchunk/decode_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class container
     * @brief Generic chunk sequence of a PNG file
     *
     * The container keeps chunks in file order and does not interpret them:
     * neither a leading IHDR nor a trailing IEND is enforced.
     */
    class PNGCHUNK_EXPORT container {
    public:
        using signature_type = std::array<std::uint8_t, 8>;

        /// Fixed 8-byte magic prefix of every PNG file
        static constexpr signature_type standard_signature{
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        container() = default;
        explicit container(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG byte stream
         * @param data Whole file contents
         * @param options Decoding options
         * @return Container holding every chunk in file order
         * @throws codec_error header for a wrong signature, length for a
         *         truncated chunk, or any kind raised by chunk::decode
         */
        static container decode(const std::vector<std::byte>& data, const decode_options& options);

        static container decode(const std::vector<std::byte>& data) {
            return decode(data, decode_options{});
        }

        static container decode(const std::byte* data, std::size_t size, const decode_options& options);

        /**
         * @brief Serialize as signature followed by every encoded chunk
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief First chunk whose type renders as the given text
         * @return Pointer into the container or nullptr; invalidated by append/remove
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Add a chunk at the end of the sequence
         *
         * No ordering is enforced, so a chunk appended after IEND stays after it.
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk whose type renders as the given text
         * @return The removed chunk, or nullopt if none matched
         */
        std::optional<chunk> remove_first_chunk(std::string_view type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }
        [[nodiscard]] const signature_type& header() const { return standard_signature; }

    private:
        std::vector<chunk> m_chunks;
    };

    /**
     * @brief Print every chunk, one per line
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const container& c);

} // namespace pngchunk
