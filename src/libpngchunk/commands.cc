//
// Created on 05/09/2025.
//

#include <pngchunk/commands.hh>
#include <pngchunk/png.hh>
#include <pngchunk/io.hh>
#include <pngchunk/exceptions.hh>

#include <ostream>

namespace pngchunk::commands {

    static png load(const std::filesystem::path& path, const parse_options& options) {
        return png::parse(read_file(path), options);
    }

    void encode(const std::filesystem::path& path,
                std::string_view type_code,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options) {
        // Validate the type before touching the file
        chunk_type type(type_code);

        png image = load(path, options);

        std::vector<std::byte> payload;
        payload.reserve(message.size());
        for (char ch : message) {
            payload.push_back(static_cast<std::byte>(ch));
        }
        image.append_chunk(chunk(type, std::move(payload)));

        write_file(output.value_or(path), image.serialize());
    }

    std::string decode(const std::filesystem::path& path,
                       std::string_view type_code,
                       const parse_options& options) {
        png image = load(path, options);

        const chunk* found = image.chunk_by_type(type_code);
        if (!found) {
            THROW_NOT_FOUND("No chunk of type '", type_code, "' in '", path.string(), "'");
        }
        return found->data_as_string();
    }

    chunk remove(const std::filesystem::path& path,
                 std::string_view type_code,
                 const parse_options& options) {
        png image = load(path, options);

        chunk removed = image.remove_first_chunk(type_code);
        write_file(path, image.serialize());
        return removed;
    }

    void print(const std::filesystem::path& path,
               std::ostream& os,
               const parse_options& options) {
        os << load(path, options);
    }

} // namespace pngchunk::commands
