//
// Created on 05/09/2025.
//

#pragma once

#include <filesystem>
#include <vector>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    // Read a whole file into memory. Throws io_error on failure.
    PNGCHUNK_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    // Create or truncate path and write bytes to it. Throws io_error on failure.
    PNGCHUNK_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes);

}
