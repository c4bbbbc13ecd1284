//
// Created by igor on 04/09/2025.
//

#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include "input.hh"

namespace pngchunk {

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size)
        : chunk_iterator(data, size, decode_options{}) {
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& data)
        : chunk_iterator(data.data(), data.size(), decode_options{}) {
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& data, const decode_options& options)
        : chunk_iterator(data.data(), data.size(), options) {
    }

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const decode_options& options)
        : m_reader(std::make_unique<memory_reader>(data, size))
        , m_options(options)
        , m_ended(false) {
        const auto& sig = container::standard_signature;

        THROW_CODEC_IF(size < sig.size(), header,
                       "buffer of ", size, " bytes is too short for the ", sig.size(), " byte signature");

        container::signature_type head;
        auto got = m_reader->read(head.data(), head.size());
        THROW_CODEC_UNLESS(got == head.size() && head == sig, header, "signature bytes do not match the PNG signature");

        // Read the first chunk
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }
        if (!read_next_chunk()) {
            m_ended = true;
            m_current.reset();
        }
    }

    bool chunk_iterator::read_next_chunk() {
        std::uint64_t start_pos = m_reader->tell();
        std::uint64_t available = m_reader->remaining();

        if (available == 0) {
            return false;
        }
        if (available < chunk::overhead) {
            return handle_truncated(start_pos, available, chunk::overhead);
        }

        auto length = m_reader->peek<std::uint32_t>(byte_order::big);
        THROW_CODEC_IF(length > m_options.max_chunk_size, length,
                       "chunk at offset ", start_pos, " has length ", length,
                       " bytes, which exceeds maximum allowed size of ", m_options.max_chunk_size, " bytes");

        std::uint64_t total = static_cast<std::uint64_t>(length) + chunk::overhead;
        if (available < total) {
            return handle_truncated(start_pos, available, total);
        }

        const std::byte* p = m_reader->current();
        m_reader->seek(total, reader_base::cur);

        auto decoded = decode_chunk(p, static_cast<std::size_t>(total), start_pos);
        chunk_header header{decoded.type(), decoded.length(), start_pos, decoded.crc()};
        m_current.emplace(chunk_info{header, std::move(decoded)});
        return true;
    }

    bool chunk_iterator::handle_truncated(std::uint64_t offset, std::uint64_t available, std::uint64_t needed) {
        THROW_CODEC_IF(m_options.strict, length,
                       "truncated chunk at offset ", offset, ": ", available,
                       " bytes remain but ", needed, " are required");

        warn(offset, "trailing_data",
             build_error_msg("dropping ", available, " trailing bytes at offset ", offset,
                             " (", needed, " required for a complete chunk)"));
        m_reader->seek(0, reader_base::end);
        return false;
    }

    chunk chunk_iterator::decode_chunk(const std::byte* data, std::size_t size, std::uint64_t offset) {
        if (m_options.verify_crc) {
            return chunk::decode(data, size);
        }

        // Validate framing and type, then rebuild so the checksum matches the data
        auto type = chunk_type::from_bytes(data + 4);
        std::vector<std::byte> payload(data + 8, data + size - 4);
        chunk rebuilt(type, std::move(payload));

        memory_reader tail(data + size - 4, 4);
        auto stored = tail.read<std::uint32_t>(byte_order::big);
        if (stored != rebuilt.crc()) {
            warn(offset, "crc_mismatch",
                 build_error_msg("chunk '", type, "' at offset ", offset, " stored crc ", stored,
                                 " does not match computed crc ", rebuilt.crc()));
        }
        return rebuilt;
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngchunk
