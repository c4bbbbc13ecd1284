//
// Created by igor on 03/09/2025.
//

#include "utf8.hh"
#include <cstdint>

namespace pngchunk {

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        const auto* p = reinterpret_cast<const std::uint8_t*>(data);
        std::size_t i = 0;

        while (i < size) {
            std::uint8_t c = p[i];
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((c & 0xE0) == 0xC0) {
                extra = 1;
                cp = c & 0x1F;
                min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                cp = c & 0x0F;
                min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                cp = c & 0x07;
                min_cp = 0x10000;
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }

            for (std::size_t k = 1; k <= extra; ++k) {
                std::uint8_t cc = p[i + k];
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }
}
