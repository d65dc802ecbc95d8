//
// Created on 03/09/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <limits>
#include <optional>
#include <ostream>

namespace pngchunk {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            THROW_DATA("Chunk '", m_type, "' payload of ", m_data.size(),
                       " bytes does not fit a 32 bit length");
        }
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = crc32(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::parse(const std::byte* data, std::size_t size) {
        THROW_CHUNK_IF(size < envelope_size, too_short,
                       "Chunk record of ", size, " bytes is shorter than the ",
                       envelope_size, " byte minimum");

        std::uint32_t length = load_be32(data);
        std::size_t payload_size = size - envelope_size;
        THROW_CHUNK_IF(length != payload_size, length_mismatch,
                       "Chunk length field says ", length, " bytes but record holds ",
                       payload_size, " payload bytes");

        // Reported as a chunk error, the caller asked for a chunk not a type
        std::optional<chunk_type> type;
        try {
            type = chunk_type::from_bytes(data + 4);
        } catch (const type_parse_error& e) {
            THROW_CHUNK(invalid_type, "Invalid chunk type: ", e.what());
        }

        const std::byte* payload = data + 8;
        std::uint32_t stored_crc = load_be32(payload + payload_size);
        std::uint32_t computed_crc = crc32(*type, payload, payload_size);
        THROW_CHUNK_IF(stored_crc != computed_crc, crc_mismatch,
                       "CRC mismatch in chunk '", *type, "': stored 0x", std::hex, stored_crc,
                       ", computed 0x", computed_crc);

        return chunk(length, *type, std::vector<std::byte>(payload, payload + payload_size), stored_crc);
    }

    std::string chunk::data_as_string() const {
        if (m_length != m_data.size()) {
            THROW_DATA("Chunk '", m_type, "' length ", m_length,
                       " doesn't match the data length ", m_data.size());
        }

        std::string result;
        result.reserve(m_data.size());
        for (std::byte b : m_data) {
            result.push_back(static_cast<char>(b));
        }
        return result;
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + total_size());

        std::byte* p = out.data() + pos;
        store_be32(p, m_length);
        m_type.write_bytes(p + 4);
        std::copy(m_data.begin(), m_data.end(), p + 8);
        store_be32(p + 8 + m_data.size(), m_crc);
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        std::string text;
        try {
            text = c.data_as_string();
        } catch (const data_error&) {
            return os << "There was an error displaying chunk data";
        }
        return os << text;
    }

} // namespace pngchunk
