//
// Created by igor on 04/09/2025.
//

#include <pngchunk/container.hh>
#include <pngchunk/chunk_iterator.hh>
#include <algorithm>
#include <ostream>

namespace pngchunk {

    container::container(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    container container::decode(const std::vector<std::byte>& data, const decode_options& options) {
        return decode(data.data(), data.size(), options);
    }

    container container::decode(const std::byte* data, std::size_t size, const decode_options& options) {
        container result;
        chunk_iterator it(data, size, options);

        while (it.has_next()) {
            result.m_chunks.push_back(it.current().decoded);
            it.next();
        }
        return result;
    }

    std::vector<std::byte> container::encode() const {
        std::size_t total = standard_signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (auto b : standard_signature) {
            out.push_back(static_cast<std::byte>(b));
        }
        for (const auto& c : m_chunks) {
            c.encode_to(out);
        }
        return out;
    }

    const chunk* container::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    void container::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    std::optional<chunk> container::remove_first_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            return std::nullopt;
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::ostream& operator<<(std::ostream& os, const container& c) {
        for (const auto& ch : c.chunks()) {
            os << ch << '\n';
        }
        return os;
    }

} // namespace pngchunk
