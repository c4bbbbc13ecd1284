/**
 * @file chunk_iterator.hh
 * @brief Sequential chunk iterator over an in-memory PNG image
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <cstddef>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_header.hh>
#include <pngchunk/decode_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    class memory_reader;

    /**
     * @class chunk_iterator
     * @brief Walks the chunks of a PNG byte stream in file order
     *
     * The signature is verified on construction and the first chunk is
     * decoded immediately. The buffer must outlive the iterator.
     *
     * @code
     *   chunk_iterator it(bytes);
     *   while (it.has_next()) {
     *       use(it.current().decoded);
     *       it.next();
     *   }
     * @endcode
     */
    class PNGCHUNK_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk
         */
        struct chunk_info {
            chunk_header header;    ///< Framing of the chunk in the buffer
            chunk decoded;          ///< Decoded chunk
        };

        chunk_iterator(const std::byte* data, std::size_t size);
        chunk_iterator(const std::byte* data, std::size_t size, const decode_options& options);
        explicit chunk_iterator(const std::vector<std::byte>& data);
        chunk_iterator(const std::vector<std::byte>& data, const decode_options& options);
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         * @return Reference to current chunk information; only valid while has_next()
         */
        const chunk_info& current() const { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next();

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        bool read_next_chunk();
        bool handle_truncated(std::uint64_t offset, std::uint64_t available, std::uint64_t needed);
        chunk decode_chunk(const std::byte* data, std::size_t size, std::uint64_t offset);
        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        std::unique_ptr<memory_reader> m_reader;
        decode_options m_options;
        std::optional<chunk_info> m_current;
        bool m_ended;
    };

} // namespace pngchunk
