//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstddef>

namespace pngchunk {
    // Strict UTF-8 validation: rejects overlong forms, surrogates and
    // code points above U+10FFFF
    bool is_valid_utf8(const std::byte* data, std::size_t size);
}
