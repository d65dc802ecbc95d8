/**
 * @file png.hh
 * @brief PNG container: signature plus an ordered list of chunks
 * @date 04/09/2025
 */

#pragma once

#include <array>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief In-memory PNG stream
     *
     * Holds the 8 byte signature and the chunks in file order. Order
     * matters: it is kept on serialization and decides which chunk
     * is "first" for lookup and removal. Parsing an unmodified stream
     * and serializing it again yields the original bytes.
     */
    class PNGCHUNK_EXPORT png {
    public:
        static constexpr std::array<std::uint8_t, 8> signature{
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG stream
         * @param data Stream bytes
         * @param size Stream size in bytes
         * @param options Limits and warning handler
         * @return The parsed container
         * @throws format_error if the signature is missing
         * @throws chunk_parse_error if any chunk is malformed or truncated
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static png parse(const std::vector<std::byte>& bytes, const parse_options& options = {}) {
            return parse(bytes.data(), bytes.size(), options);
        }

        /// Add a chunk after the last one. Duplicated types are allowed.
        void append_chunk(chunk c);

        /**
         * @brief Find the first chunk with the given type code
         * @return Pointer into the container, nullptr if there is none
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view code) const;

        /**
         * @brief Remove the first chunk with the given type code
         * @return The removed chunk
         * @throws not_found_error if no chunk matches; the container is unchanged
         */
        chunk remove_first_chunk(std::string_view code);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const { return signature; }

        [[nodiscard]] std::vector<std::byte> serialize() const;

        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
