//
// Test to verify error messages carry useful details
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("Error messages") {
    SUBCASE("error kind names") {
        CHECK(std::string(to_string(error_kind::header)) == "Invalid Header");
        CHECK(std::string(to_string(error_kind::length)) == "Invalid Length");
        CHECK(std::string(to_string(error_kind::type)) == "Invalid Type");
        CHECK(std::string(to_string(error_kind::data)) == "Invalid Data");
        CHECK(std::string(to_string(error_kind::crc)) == "Invalid Crc");
    }

    SUBCASE("exception hierarchy") {
        codec_error codec(error_kind::crc, "x");
        io_error io("y");
        CHECK(dynamic_cast<const pngchunk_error*>(&codec) != nullptr);
        CHECK(dynamic_cast<const pngchunk_error*>(&io) != nullptr);
        CHECK(dynamic_cast<const std::runtime_error*>(&codec) != nullptr);
        CHECK(codec.kind() == error_kind::crc);
    }

    SUBCASE("length mismatch names the chunk and sizes") {
        auto bytes = raw_chunk(50, "RuSt", secret_message, secret_message_crc);
        try {
            chunk::decode(bytes);
            FAIL("Should have thrown exception");
        } catch (const codec_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(e.kind() == error_kind::length);
            CHECK(msg.find("Invalid Length") != std::string::npos);
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("50") != std::string::npos);
            CHECK(msg.find("42") != std::string::npos);
        }
    }

    SUBCASE("crc mismatch shows both checksums") {
        auto bytes = raw_chunk(42, "RuSt", secret_message, 2882656333u);
        try {
            chunk::decode(bytes);
            FAIL("Should have thrown exception");
        } catch (const codec_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("2882656333") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
        }
    }

    SUBCASE("truncated container shows offset") {
        auto chunks = sample_chunks();
        auto data = png_bytes(chunks);
        data.pop_back();
        auto iend_offset = data.size() + 1 - chunks.back().encoded_size();
        try {
            container::decode(data);
            FAIL("Should have thrown exception");
        } catch (const codec_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(e.kind() == error_kind::length);
            CHECK(msg.find("offset " + std::to_string(iend_offset)) != std::string::npos);
        }
    }

    SUBCASE("chunk size limit shows limit and size") {
        auto data = png_bytes(sample_chunks());
        decode_options opts;
        opts.max_chunk_size = 10;
        try {
            container::decode(data, opts);
            FAIL("Should have thrown exception");
        } catch (const codec_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("offset 8") != std::string::npos);
            CHECK(msg.find("13") != std::string::npos);
            CHECK(msg.find("10 bytes") != std::string::npos);
        }
    }

    SUBCASE("default limit admits lengths above 2^31") {
        auto data = signature_bytes();
        auto tail = raw_chunk(0x80000000u, "ruSt", "", 0);
        data.insert(data.end(), tail.begin(), tail.end());
        try {
            container::decode(data);
            FAIL("Should have thrown exception");
        } catch (const codec_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(e.kind() == error_kind::length);
            CHECK(msg.find("truncated") != std::string::npos);
            CHECK(msg.find("exceeds maximum") == std::string::npos);
        }
    }
}
