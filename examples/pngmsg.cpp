/**
 * @file pngmsg.cpp
 * @brief Hide, read and remove text messages in PNG files
 *
 * Messages are stored as chunks of a user-chosen type. The image data
 * itself is never touched, so the file stays a valid PNG as long as the
 * chosen type is ancillary (lowercase first letter).
 */

#include <pngchunk/container.hh>
#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> <file> [args]\n";
        std::cout << "\n";
        std::cout << "Hide a secret message in a PNG file.\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk_type> <message> [output]\n";
        std::cout << "    Append a chunk holding message, write to output (default: file)\n";
        std::cout << "\n";
        std::cout << "  decode <file> <chunk_type>\n";
        std::cout << "    Print the message stored in the first chunk of that type\n";
        std::cout << "\n";
        std::cout << "  remove <file> <chunk_type>\n";
        std::cout << "    Remove the first chunk of that type and rewrite the file\n";
        std::cout << "\n";
        std::cout << "  print <file>\n";
        std::cout << "    Print every chunk in the file\n";
    }

    int run_encode(const std::vector<std::string>& args) {
        if (args.size() < 3 || args.size() > 4) {
            std::cerr << "encode expects <file> <chunk_type> <message> [output]\n";
            return 2;
        }
        auto png = pngchunk::container::decode(pngchunk::load_file(args[0]));
        png.append_chunk(pngchunk::chunk(pngchunk::chunk_type::from_string(args[1]), args[2]));

        const std::string& out_path = args.size() == 4 ? args[3] : args[0];
        pngchunk::save_file(out_path, png.encode());
        return 0;
    }

    int run_decode(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cerr << "decode expects <file> <chunk_type>\n";
            return 2;
        }
        auto png = pngchunk::container::decode(pngchunk::load_file(args[0]));
        const auto* found = png.chunk_by_type(args[1]);
        if (!found) {
            std::cerr << args[1] << " wasn't found in the png\n";
            return 1;
        }
        std::cout << found->data_as_string() << "\n";
        return 0;
    }

    int run_remove(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cerr << "remove expects <file> <chunk_type>\n";
            return 2;
        }
        auto png = pngchunk::container::decode(pngchunk::load_file(args[0]));
        if (!png.remove_first_chunk(args[1])) {
            std::cerr << args[1] << " wasn't found in the png\n";
            return 1;
        }
        pngchunk::save_file(args[0], png.encode());
        std::cout << args[1] << " is removed\n";
        return 0;
    }

    int run_print(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            std::cerr << "print expects <file>\n";
            return 2;
        }
        auto png = pngchunk::container::decode(pngchunk::load_file(args[0]));
        std::cout << png;
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "encode") {
            return run_encode(args);
        } else if (command == "decode") {
            return run_decode(args);
        } else if (command == "remove") {
            return run_remove(args);
        } else if (command == "print") {
            return run_print(args);
        }
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const pngchunk::codec_error& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return 1;
    } catch (const pngchunk::io_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
