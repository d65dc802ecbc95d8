//
// Created on 05/09/2025.
//

#include <pngchunk/io.hh>
#include <pngchunk/exceptions.hh>

#include <fstream>

namespace pngchunk {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream stream(path, std::ios::binary);
        THROW_IO_UNLESS(stream.good(), "Cannot open file '", path.string(), "' for reading");

        // Get file size
        stream.seekg(0, std::ios::end);
        auto size = stream.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of '", path.string(), "'");
        stream.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));

        auto actual = static_cast<std::size_t>(stream.gcount());
        THROW_IO_IF(actual != data.size(), "Unexpected EOF reading '", path.string(),
                    "': requested ", data.size(), " got ", actual);
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(stream.good(), "Cannot open file '", path.string(), "' for writing");

        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        stream.flush();
        THROW_IO_IF(stream.fail(), "Stream write failed for '", path.string(), "'");
    }

}
