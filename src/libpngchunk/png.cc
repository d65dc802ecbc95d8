//
// Created on 04/09/2025.
//

#include <pngchunk/png.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <ostream>

namespace pngchunk {

    static constexpr std::string_view IEND = "IEND";

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        const bool has_signature = size >= signature.size() &&
            std::equal(signature.begin(), signature.end(), data,
                       [](std::uint8_t s, std::byte b) { return s == static_cast<std::uint8_t>(b); });
        if (!has_signature) {
            THROW_FORMAT("Not a PNG stream: missing the 8 byte PNG signature (input is ",
                         size, " bytes)");
        }

        png result;
        bool seen_iend = false;
        std::size_t offset = signature.size();

        while (offset < size) {
            std::size_t remaining = size - offset;
            THROW_CHUNK_IF(remaining < chunk::envelope_size, truncated,
                           "Truncated chunk at offset ", offset, ": only ", remaining,
                           " bytes left, a chunk needs at least ", chunk::envelope_size);

            std::uint32_t length = load_be32(data + offset);
            if (length > options.max_chunk_size) {
                THROW_CHUNK(size_limit, "Chunk at offset ", offset, " has size ", length,
                            " bytes, which exceeds maximum allowed size of ",
                            options.max_chunk_size, " bytes");
            }
            THROW_CHUNK_IF(length > remaining - chunk::envelope_size, truncated,
                           "Truncated chunk at offset ", offset, ": declares ", length,
                           " payload bytes but only ", remaining - chunk::envelope_size,
                           " remain");
            THROW_CHUNK_IF(result.m_chunks.size() >= options.max_chunks, size_limit,
                           "Chunk at offset ", offset, " exceeds maximum allowed count of ",
                           options.max_chunks, " chunks");

            std::size_t record_size = chunk::envelope_size + length;
            chunk c = [&] {
                try {
                    return chunk::parse(data + offset, record_size);
                } catch (const chunk_parse_error& e) {
                    throw chunk_parse_error(e.why(), build_error_msg(e.what(), " (at offset ", offset, ")"));
                }
            }();

            if (options.on_warning) {
                if (seen_iend) {
                    options.on_warning(offset, "after_iend",
                        "Chunk '" + c.type().to_string() + "' follows the IEND chunk");
                }
                if (!c.type().is_reserved_bit_valid()) {
                    options.on_warning(offset, "reserved_bit",
                        "Chunk '" + c.type().to_string() + "' has the reserved bit set");
                }
            }
            seen_iend = seen_iend || c.type().to_string_view() == IEND;

            result.m_chunks.push_back(std::move(c));
            offset += record_size;
        }

        if (!seen_iend && options.on_warning) {
            options.on_warning(size, "missing_iend", "Stream ends without an IEND chunk");
        }

        return result;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png::chunk_by_type(std::string_view code) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [code](const chunk& c) {
            return c.type().to_string_view() == code;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_first_chunk(std::string_view code) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [code](const chunk& c) {
            return c.type().to_string_view() == code;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("Chunk '", code, "' not found");
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png::serialize() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (std::uint8_t s : signature) {
            out.push_back(static_cast<std::byte>(s));
        }
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.m_chunks.size() << " chunk(s)\n";
        for (std::size_t i = 0; i < p.m_chunks.size(); ++i) {
            const chunk& c = p.m_chunks[i];
            os << "  [" << i << "] " << c.type() << " (" << c.length() << " bytes): " << c << "\n";
        }
        return os;
    }

} // namespace pngchunk
