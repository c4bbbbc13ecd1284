//
// Created by igor on 03/09/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/exceptions.hh>
#include <ostream>
#include <iomanip>
#include "input.hh"
#include "utf8.hh"

namespace pngchunk {

    namespace {
        void append_u32be(std::vector<std::byte>& out, std::uint32_t value) {
            std::uint32_t be = swap32be(value);
            const auto* p = reinterpret_cast<const std::byte*>(&be);
            out.insert(out.end(), p, p + 4);
        }
    }

    std::uint32_t chunk::compute_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        auto state = crc32::update(crc32::init, type.to_bytes().data(), 4);
        state = crc32::update(state, data, size);
        return crc32::finalize(state);
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        THROW_CODEC_IF(m_data.size() > max_length, length,
                       "chunk '", m_type, "' payload of ", m_data.size(),
                       " bytes does not fit a 32-bit length field");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = compute_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk chunk::decode(const std::byte* data, std::size_t size) {
        THROW_CODEC_IF(size < overhead, length,
                       "chunk needs at least ", overhead, " bytes, got ", size);

        memory_reader in(data, size);
        auto length = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        THROW_CODEC_IF(static_cast<std::uint64_t>(length) + overhead != size, length,
                       "chunk '", type, "' declares ", length, " data bytes but buffer holds ",
                       size - overhead);

        auto payload = in.read_exact(length);
        auto stored_crc = in.read<std::uint32_t>(byte_order::big);

        auto actual_crc = compute_crc(type, payload.data(), payload.size());
        THROW_CODEC_IF(actual_crc != stored_crc, crc,
                       "chunk '", type, "' stored crc ", stored_crc, " does not match computed crc ", actual_crc);

        return chunk(length, type, std::move(payload), stored_crc);
    }

    void chunk::encode_to(std::vector<std::byte>& out) const {
        out.reserve(out.size() + encoded_size());
        append_u32be(out, m_length);
        const auto& tb = m_type.to_bytes();
        const auto* tp = reinterpret_cast<const std::byte*>(tb.data());
        out.insert(out.end(), tp, tp + tb.size());
        out.insert(out.end(), m_data.begin(), m_data.end());
        append_u32be(out, m_crc);
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out;
        encode_to(out);
        return out;
    }

    std::string chunk::data_as_string() const {
        THROW_CODEC_UNLESS(is_valid_utf8(m_data.data(), m_data.size()), data,
                           "payload of chunk '", m_type, "' is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << c.length() << ' ' << c.type() << ' ';
        const auto& data = c.data();
        if (is_valid_utf8(data.data(), data.size())) {
            os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        } else {
            auto flags = os.flags();
            auto fill = os.fill();
            for (std::size_t i = 0; i < data.size(); ++i) {
                if (i > 0) {
                    os << ' ';
                }
                os << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(std::to_integer<std::uint8_t>(data[i]));
            }
            os.flags(flags);
            os.fill(fill);
        }
        return os << ' ' << c.crc();
    }

} // namespace pngchunk
