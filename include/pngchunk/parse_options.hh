/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG streams
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <limits>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG streams
     *
     * Controls size limits and warning handling. Parsing itself is
     * always strict: a malformed chunk fails the whole stream.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * A chunk declaring a larger length fails to parse.
         * Default is no limit: every 32 bit length is accepted.
         */
        std::uint32_t max_chunk_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @brief Maximum number of chunks in one stream
         *
         * Default is no limit.
         */
        std::size_t max_chunks = std::numeric_limits<std::size_t>::max();

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset in the input where the warning occurred
         * @param category Warning category ("reserved_bit", "after_iend", "missing_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * Called for well-formed but suspicious input. Warnings never
         * change the parse result. If not set, warnings are ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
