//
// Created by igor on 05/09/2025.
//

#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>
#include <fstream>
#include <system_error>

namespace pngchunk {

    std::vector<std::byte> load_file(const std::filesystem::path& path) {
        std::error_code ec;
        THROW_IO_UNLESS(std::filesystem::exists(path, ec), "File does not exist: ", path.string());
        THROW_IO_UNLESS(std::filesystem::is_regular_file(path, ec), "Not a regular file: ", path.string());

        std::ifstream stream(path, std::ios::binary);
        THROW_IO_UNLESS(stream, "Cannot open file: ", path.string());

        // Get file size
        stream.seekg(0, std::ios::end);
        auto size = stream.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of ", path.string());
        stream.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        if (!data.empty()) {
            stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(stream.gcount() != static_cast<std::streamsize>(data.size()),
                        "Short read from ", path.string(), ": expected ", data.size(),
                        " bytes, got ", stream.gcount());
        }
        return data;
    }

    void save_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(stream, "Cannot open file for writing: ", path.string());

        stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        stream.flush();
        THROW_IO_UNLESS(stream, "Failed to write ", data.size(), " bytes to ", path.string());
    }

} // namespace pngchunk
