//
// Created on 03/09/2025.
//

#include <pngchunk/crc.hh>

#include <algorithm>
#include <array>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size) {
        std::array<std::uint8_t, 4> type_bytes = type.to_bytes();

        uLong c = ::crc32(0L, Z_NULL, 0);
        c = ::crc32(c, reinterpret_cast<const Bytef*>(type_bytes.data()), static_cast<uInt>(type_bytes.size()));

        // zlib takes lengths as uInt, feed large payloads piecewise
        constexpr std::size_t max_piece = std::numeric_limits<uInt>::max();
        const auto* p = reinterpret_cast<const Bytef*>(data);
        while (size > 0) {
            std::size_t piece = std::min(size, max_piece);
            c = ::crc32(c, p, static_cast<uInt>(piece));
            p += piece;
            size -= piece;
        }
        return static_cast<std::uint32_t>(c);
    }

} // namespace pngchunk
