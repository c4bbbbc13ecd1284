//
// Created by igor on 03/09/2025.
//

#include <algorithm>

#include "input.hh"

namespace pngchunk {
    // reader_base implementation
    chunk_type reader_base::read_chunk_type() {
        chunk_type::bytes_type data;
        std::size_t actual = read(data.data(), 4);
        THROW_CODEC_IF(actual != 4, length, "failed to read chunk type at offset ", tell() - actual);
        return chunk_type::from_bytes(data);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {}

    memory_reader::memory_reader(const std::vector<std::byte>& data)
        : memory_reader(data.data(), data.size()) {}

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::size_t available = m_size - m_position;
        size = std::min(size, available);
        if (size > 0) {
            std::memcpy(dst, m_data + m_position, size);
            m_position += size;
        }
        return size;
    }

    void memory_reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                new_pos = m_size - offset;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        THROW_CODEC_IF(new_pos > m_size, length, "seek beyond end of data: ", new_pos, " > ", m_size);
        m_position = static_cast<std::size_t>(new_pos);
    }

    std::uint64_t memory_reader::tell() const {
        return m_position;
    }

    std::uint64_t memory_reader::size() const {
        return m_size;
    }
}
