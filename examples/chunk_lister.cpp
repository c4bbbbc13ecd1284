/**
 * @file chunk_lister.cpp
 * @brief List the chunks of a PNG file with their type properties
 *
 * Decoding is relaxed: checksum mismatches and trailing garbage are
 * reported as warnings so damaged files can still be inspected.
 */

#include <pngchunk/parser.hh>
#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <iomanip>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Lists all chunks in a PNG file.\n";
        return 1;
    }

    pngchunk::decode_options options;
    options.strict = false;
    options.verify_crc = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto data = pngchunk::load_file(argv[1]);

        std::cout << "Parsing: " << argv[1] << " (" << data.size() << " bytes)\n";
        std::cout << "====================\n\n";

        std::size_t count = 0;
        pngchunk::for_each_chunk(data, [&count](const pngchunk::chunk_iterator::chunk_info& info) {
            const auto& type = info.header.type;
            std::cout << std::setw(8) << info.header.file_offset << "  " << type
                      << "  " << std::setw(10) << info.header.length << " bytes"
                      << "  crc=0x" << std::hex << std::setw(8) << std::setfill('0') << info.header.crc
                      << std::dec << std::setfill(' ')
                      << "  " << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy");
            if (!type.is_reserved_bit_valid()) {
                std::cout << ", reserved bit set";
            }
            std::cout << "\n";
            ++count;
        }, options);

        std::cout << "\n" << count << " chunk(s)\n";

    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
