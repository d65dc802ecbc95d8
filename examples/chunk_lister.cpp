/**
 * @file chunk_lister.cpp
 * @brief Simple example demonstrating basic libpngchunk usage
 *
 * Parses a PNG file and prints every chunk with its size, CRC and
 * the properties encoded in its type code.
 */

#include <pngchunk/png.hh>
#include <pngchunk/io.hh>
#include <iostream>
#include <iomanip>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        auto image = pngchunk::png::parse(pngchunk::read_file(argv[1]), options);

        for (const auto& chunk : image.chunks()) {
            const auto& type = chunk.type();
            std::cout << "Chunk: " << type << " (" << chunk.length() << " bytes)"
                      << "  crc 0x" << std::hex << std::setw(8) << std::setfill('0')
                      << chunk.crc() << std::dec << std::setfill(' ') << "\n";
            std::cout << "  " << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe to copy" : "unsafe to copy");
            if (!type.is_reserved_bit_valid()) {
                std::cout << ", reserved bit set";
            }
            std::cout << "\n";
        }

        std::cout << "\n" << image.chunks().size() << " chunk(s), parsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
