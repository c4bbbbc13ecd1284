//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>

#include <pngchunk/exceptions.hh>

namespace pngchunk {
    /**
     * @class chunk_type
     * @brief Validated four letter PNG chunk type
     *
     * Every byte is an ASCII letter. Bit 5 (the lowercase bit) of each byte
     * encodes one property:
     *  - byte 0: ancillary (set) / critical (clear)
     *  - byte 1: private (set) / public (clear)
     *  - byte 2: reserved, must be clear
     *  - byte 3: safe to copy (set) / unsafe to copy (clear)
     */
    class chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        static constexpr std::uint8_t property_bit = 1u << 5;

        // Check a single byte against the letter ranges [A-Z] and [a-z]
        static constexpr bool is_valid_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Validate and build from raw bytes; throws codec_error(type)
        static chunk_type from_bytes(const bytes_type& bytes) {
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                THROW_CODEC_UNLESS(is_valid_byte(bytes[i]), type,
                                   "byte ", i, " of chunk type is 0x", std::hex,
                                   static_cast<unsigned>(bytes[i]), ", expected an ASCII letter");
            }
            return chunk_type(bytes);
        }

        // Validate and build from 4 raw bytes in memory
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, 4);
            return from_bytes(bytes);
        }

        // Validate and build from text; must be exactly 4 letters
        static chunk_type from_string(std::string_view sv) {
            THROW_CODEC_UNLESS(sv.size() == 4, type,
                               "chunk type '", sv, "' has ", sv.size(), " bytes, expected 4");
            bytes_type bytes;
            std::copy_n(sv.begin(), 4, bytes.begin());
            return from_bytes(bytes);
        }

        [[nodiscard]] const bytes_type& to_bytes() const { return b; }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        [[nodiscard]] bool is_critical() const { return (b[0] & property_bit) == 0; }
        [[nodiscard]] bool is_public() const { return (b[1] & property_bit) == 0; }
        [[nodiscard]] bool is_reserved_bit_valid() const { return (b[2] & property_bit) == 0; }
        [[nodiscard]] bool is_safe_to_copy() const { return (b[3] & property_bit) != 0; }

        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        bool operator==(std::string_view sv) const { return to_string_view() == sv; }
        bool operator!=(std::string_view sv) const { return !(*this == sv); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string_view();
        }

        friend constexpr chunk_type operator""_ct(const char* str, std::size_t len);

    private:
        constexpr explicit chunk_type(const bytes_type& bytes) : b(bytes) {}

        bytes_type b;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.to_bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk type creation
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            THROW_CODEC(type, "chunk type literal '", std::string_view(str, len), "' has ", len,
                        " bytes, expected 4");
        }
        for (std::size_t i = 0; i < 4; ++i) {
            if (!chunk_type::is_valid_byte(static_cast<std::uint8_t>(str[i]))) {
                THROW_CODEC(type, "chunk type literal '", std::string_view(str, len), "' byte ", i,
                            " is not an ASCII letter");
            }
        }
        return chunk_type(chunk_type::bytes_type{
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        });
    }

    // Standard PNG chunk types
    namespace types {
        inline constexpr chunk_type IHDR = "IHDR"_ct;
        inline constexpr chunk_type PLTE = "PLTE"_ct;
        inline constexpr chunk_type IDAT = "IDAT"_ct;
        inline constexpr chunk_type IEND = "IEND"_ct;
        inline constexpr chunk_type tEXt = "tEXt"_ct;
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
