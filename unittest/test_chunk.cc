#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::vector<std::byte> secret_chunk_bytes(std::uint32_t crc = secret_message_crc) {
        return raw_chunk(42, "RuSt", secret_message, crc);
    }

    chunk testing_chunk() {
        return chunk::decode(secret_chunk_bytes());
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk creation") {
        SUBCASE("length and crc are computed") {
            chunk c(chunk_type::from_string("RuSt"), bytes_of(secret_message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_message_crc);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.data() == bytes_of(secret_message));
        }

        SUBCASE("text constructor matches byte constructor") {
            chunk a(chunk_type::from_string("RuSt"), secret_message);
            chunk b(chunk_type::from_string("RuSt"), bytes_of(secret_message));
            CHECK(a == b);
        }

        SUBCASE("empty payload") {
            chunk c(types::IEND, std::vector<std::byte>{});
            CHECK(c.length() == 0);
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.encoded_size() == 12);
        }

        SUBCASE("compute_crc covers type and data") {
            auto data = bytes_of(secret_message);
            CHECK(chunk::compute_crc(chunk_type::from_string("RuSt"), data.data(), data.size()) == secret_message_crc);
        }
    }

    TEST_CASE("chunk decoding") {
        SUBCASE("valid chunk") {
            auto c = testing_chunk();
            CHECK(c.length() == 42);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.data_as_string() == std::string(secret_message));
            CHECK(c.crc() == secret_message_crc);
        }

        SUBCASE("bad crc") {
            auto bytes = secret_chunk_bytes(2882656333u);
            CHECK_THROWS_AS(chunk::decode(bytes), codec_error);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::crc);
        }

        SUBCASE("every single bit flip in the crc field is detected") {
            const auto good = secret_chunk_bytes();
            for (std::size_t byte = good.size() - 4; byte < good.size(); ++byte) {
                for (int bit = 0; bit < 8; ++bit) {
                    auto bad = good;
                    bad[byte] ^= std::byte(1u << bit);
                    INFO("byte " << byte << " bit " << bit);
                    CHECK(codec_error_kind([&] { chunk::decode(bad); }) == error_kind::crc);
                }
            }
        }

        SUBCASE("corrupted payload is detected") {
            auto bytes = secret_chunk_bytes();
            bytes[10] ^= std::byte(0x01);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::crc);
        }

        SUBCASE("invalid type") {
            auto bytes = raw_chunk(42, "Ru1t", secret_message, secret_message_crc);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::type);
        }

        SUBCASE("declared length larger than buffer") {
            auto bytes = raw_chunk(43, "RuSt", secret_message, secret_message_crc);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::length);
        }

        SUBCASE("declared length smaller than buffer") {
            auto bytes = raw_chunk(41, "RuSt", secret_message, secret_message_crc);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::length);
        }

        SUBCASE("truncated buffer") {
            auto bytes = secret_chunk_bytes();
            bytes.pop_back();
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::length);
        }

        SUBCASE("buffer shorter than the fixed fields") {
            std::vector<std::byte> tiny(11, std::byte(0));
            CHECK(codec_error_kind([&] { chunk::decode(tiny); }) == error_kind::length);
            CHECK(codec_error_kind([] { chunk::decode(nullptr, 0); }) == error_kind::length);
        }

        SUBCASE("huge declared length does not overflow") {
            auto bytes = raw_chunk(0xFFFFFFFFu, "RuSt", "", 0);
            CHECK(codec_error_kind([&] { chunk::decode(bytes); }) == error_kind::length);
        }
    }

    TEST_CASE("chunk encoding") {
        SUBCASE("encode is the inverse of decode") {
            auto bytes = secret_chunk_bytes();
            CHECK(chunk::decode(bytes).encode() == bytes);
        }

        SUBCASE("created chunk survives decode") {
            chunk created(chunk_type::from_string("ruSt"), bytes_of("hidden"));
            auto decoded = chunk::decode(created.encode());
            CHECK(decoded.length() == created.length());
            CHECK(decoded.type() == created.type());
            CHECK(decoded.data() == created.data());
            CHECK(decoded.crc() == created.crc());
            CHECK(decoded == created);
        }

        SUBCASE("wire layout is big-endian") {
            chunk c(types::IEND, std::vector<std::byte>{});
            auto enc = c.encode();
            REQUIRE(enc.size() == 12);
            std::vector<std::byte> expected = {
                std::byte(0x00), std::byte(0x00), std::byte(0x00), std::byte(0x00),
                std::byte('I'), std::byte('E'), std::byte('N'), std::byte('D'),
                std::byte(0xAE), std::byte(0x42), std::byte(0x60), std::byte(0x82)
            };
            CHECK(enc == expected);
        }

        SUBCASE("encode_to appends") {
            std::vector<std::byte> out = {std::byte(0xFF)};
            testing_chunk().encode_to(out);
            CHECK(out.size() == 1 + 42 + 12);
            CHECK(out[0] == std::byte(0xFF));
        }
    }

    TEST_CASE("chunk payload as text") {
        SUBCASE("valid UTF-8") {
            chunk c(chunk_type::from_string("ruSt"), std::string_view("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80"));
            CHECK(c.data_as_string() == "h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("empty payload is empty text") {
            chunk c(chunk_type::from_string("ruSt"), std::string_view());
            CHECK(c.data_as_string().empty());
        }

        SUBCASE("invalid UTF-8 fails with data") {
            const char* samples[] = {
                "\xFF",             // never valid
                "\xC3",             // truncated sequence
                "\xC0\xAF",         // overlong
                "\xED\xA0\x80",     // surrogate
                "\xF4\x90\x80\x80", // above U+10FFFF
                "abc\x80"           // stray continuation byte
            };
            for (const char* s : samples) {
                chunk c(chunk_type::from_string("ruSt"), std::string_view(s));
                INFO("sample " << s);
                CHECK(codec_error_kind([&] { (void)c.data_as_string(); }) == error_kind::data);
            }
        }
    }

    TEST_CASE("chunk stream output") {
        SUBCASE("text payload") {
            std::ostringstream oss;
            oss << testing_chunk();
            CHECK(oss.str() == "42 RuSt This is where your secret message will be! 2882656334");
        }

        SUBCASE("binary payload is shown as hex") {
            chunk c(chunk_type::from_string("ruSt"), std::vector<std::byte>{std::byte(0xFF), std::byte(0x01)});
            std::ostringstream oss;
            oss << c;
            CHECK(oss.str().find("ff 01") != std::string::npos);
        }
    }
}
