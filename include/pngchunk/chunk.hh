/**
 * @file chunk.hh
 * @brief A single PNG chunk record
 * @date 03/09/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Length, type, payload and CRC of one chunk
     *
     * On the wire a chunk is laid out as:
     * @code
     *   +--------+--------+----------------+--------+
     *   | length |  type  |  data (length) |  crc   |
     *   |  BE32  | 4 char |                |  BE32  |
     *   +--------+--------+----------------+--------+
     * @endcode
     * The CRC covers type and data. A chunk object always satisfies
     * length() == data().size() and crc() == crc32(type(), data()).
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Bytes of a chunk record that are not payload (length + type + crc)
        static constexpr std::size_t envelope_size = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type
         * @param data Payload bytes
         * @throws data_error if the payload does not fit a 32 bit length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse one complete chunk record
         *
         * The buffer must hold exactly one record: its declared length
         * has to equal size - 12.
         *
         * @param data Start of the record
         * @param size Size of the record in bytes
         * @return The parsed chunk
         * @throws chunk_parse_error on any envelope or checksum violation
         */
        static chunk parse(const std::byte* data, std::size_t size);

        static chunk parse(const std::vector<std::byte>& bytes) {
            return parse(bytes.data(), bytes.size());
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size of the serialized record
        [[nodiscard]] std::size_t total_size() const { return envelope_size + m_data.size(); }

        /**
         * @brief Payload as text, one character per byte
         * @throws data_error if the length field disagrees with the payload
         */
        [[nodiscard]] std::string data_as_string() const;

        [[nodiscard]] std::vector<std::byte> serialize() const;

        /// Append the serialized record to out
        void serialize_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

        // Writes the payload text, or a placeholder if it cannot be rendered
        friend PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngchunk
