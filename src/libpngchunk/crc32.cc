//
// Created by igor on 03/09/2025.
//

#include <pngchunk/crc32.hh>

namespace pngchunk {

    namespace {
        constexpr crc32::table_type make_table() {
            crc32::table_type table{};
            for (std::uint32_t n = 0; n < 256; ++n) {
                std::uint32_t c = n;
                for (int k = 0; k < 8; ++k) {
                    c = (c & 1) ? (crc32::polynomial ^ (c >> 1)) : (c >> 1);
                }
                table[n] = c;
            }
            return table;
        }

        constexpr crc32::table_type crc_table = make_table();

        static_assert(crc_table[1] == 0x77073096u, "CRC table generation is broken");
        static_assert(crc_table[255] == 0x2D02EF8Du, "CRC table generation is broken");
    }

    const crc32::table_type& crc32::table() {
        return crc_table;
    }

    std::uint32_t crc32::update(std::uint32_t state, const void* data, std::size_t size) {
        const auto* p = static_cast<const std::uint8_t*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            state = crc_table[(state ^ p[i]) & 0xFFu] ^ (state >> 8);
        }
        return state;
    }

} // namespace pngchunk
