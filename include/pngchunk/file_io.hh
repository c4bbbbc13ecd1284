/**
 * @file file_io.hh
 * @brief Whole-file load and save helpers
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <filesystem>
#include <vector>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Read a whole file into memory
     * @param path File to read
     * @return File contents
     * @throws io_error if the path does not name a readable regular file
     */
    PNGCHUNK_EXPORT std::vector<std::byte> load_file(const std::filesystem::path& path);

    /**
     * @brief Write bytes to a file, replacing its contents
     * @throws io_error if the file cannot be written
     */
    PNGCHUNK_EXPORT void save_file(const std::filesystem::path& path, const std::vector<std::byte>& data);

} // namespace pngchunk
