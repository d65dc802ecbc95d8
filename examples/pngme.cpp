/**
 * @file pngme.cpp
 * @brief Hide text messages inside PNG files
 *
 * Stores a message in a chunk of a chosen type, reads it back,
 * removes it again, or prints every chunk of a file.
 */

#include <pngchunk/commands.hh>
#include <pngchunk/parse_options.hh>
#include <iostream>
#include <optional>
#include <string>

static void print_usage(const char* prog) {
    std::cout << "Usage:\n";
    std::cout << "  " << prog << " encode <file> <chunk_type> <message> [output_file]\n";
    std::cout << "  " << prog << " decode <file> <chunk_type>\n";
    std::cout << "  " << prog << " remove <file> <chunk_type>\n";
    std::cout << "  " << prog << " print <file>\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  encode  Append a chunk holding <message>; writes to output_file or back to <file>\n";
    std::cout << "  decode  Print the message of the first chunk of <chunk_type>\n";
    std::cout << "  remove  Delete the first chunk of <chunk_type> from <file>\n";
    std::cout << "  print   List all chunks of <file>\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << prog << " encode image.png ruSt \"hidden message\"\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];

    pngchunk::parse_options options;
    options.on_warning = [](std::uint64_t offset,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            std::optional<std::filesystem::path> output;
            if (argc == 6) {
                output = argv[5];
            }
            pngchunk::commands::encode(argv[2], argv[3], argv[4], output, options);
            std::cout << "Message stored in chunk '" << argv[3] << "'\n";
        } else if (command == "decode" && argc == 4) {
            std::cout << pngchunk::commands::decode(argv[2], argv[3], options) << "\n";
        } else if (command == "remove" && argc == 4) {
            auto removed = pngchunk::commands::remove(argv[2], argv[3], options);
            std::cout << "Removed chunk '" << removed.type() << "' (" << removed.length() << " bytes)\n";
        } else if (command == "print" && argc == 3) {
            pngchunk::commands::print(argv[2], std::cout, options);
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
