/**
 * @file commands.hh
 * @brief Hide, show and strip text messages in PNG files
 * @date 05/09/2025
 *
 * Each command reads the whole file, works on the parsed container
 * and, where it changes something, writes the result back. Errors are
 * reported by the exceptions of exceptions.hh.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk::commands {

    /**
     * @brief Append a chunk holding message to a PNG file
     * @param path File to read
     * @param type_code Four letter chunk type of the new chunk
     * @param message Payload text
     * @param output Where to write the result; path itself if not given
     * @param options Options used to parse the input
     */
    PNGCHUNK_EXPORT void encode(const std::filesystem::path& path,
                                std::string_view type_code,
                                std::string_view message,
                                const std::optional<std::filesystem::path>& output = std::nullopt,
                                const parse_options& options = {});

    /**
     * @brief Text of the first chunk with the given type
     * @throws not_found_error if the file has no such chunk
     */
    PNGCHUNK_EXPORT std::string decode(const std::filesystem::path& path,
                                       std::string_view type_code,
                                       const parse_options& options = {});

    /**
     * @brief Remove the first chunk with the given type and rewrite the file
     * @return The removed chunk
     */
    PNGCHUNK_EXPORT chunk remove(const std::filesystem::path& path,
                                 std::string_view type_code,
                                 const parse_options& options = {});

    /// Write a listing of all chunks of a PNG file to os
    PNGCHUNK_EXPORT void print(const std::filesystem::path& path,
                               std::ostream& os,
                               const parse_options& options = {});

} // namespace pngchunk::commands
