/**
 * @file crc.hh
 * @brief CRC-32 checksum of PNG chunks
 * @date 03/09/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @brief Compute the checksum stored in a chunk record
     *
     * CRC-32/ISO-HDLC (the PNG and zip polynomial) over the four type
     * bytes followed by the payload. Chunk construction and chunk
     * parsing both go through this function.
     *
     * @param type Chunk type, hashed first
     * @param data Payload bytes (may be null when size is 0)
     * @param size Payload size in bytes
     * @return Checksum value
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size);

} // namespace pngchunk
