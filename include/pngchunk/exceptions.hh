/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @date 02/09/2025
 *
 * Every failure in the library is reported by throwing one of the
 * classes below. They all derive from pngchunk_error, so a caller that
 * does not care about the exact kind can catch the base class.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class type_parse_error
     * @brief A chunk type code is not four ASCII letters
     */
    class type_parse_error : public pngchunk_error {
    public:
        explicit type_parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class chunk_parse_error
     * @brief Exception for malformed chunk records
     *
     * The reason is kept so that diagnostics can tell a checksum
     * failure from a truncated stream.
     */
    class chunk_parse_error : public pngchunk_error {
    public:
        enum class reason {
            too_short,       ///< Fewer than 12 bytes
            length_mismatch, ///< Length field disagrees with the payload size
            invalid_type,    ///< Type bytes are not ASCII letters
            crc_mismatch,    ///< Stored CRC differs from the computed one
            truncated,       ///< Stream ends inside a chunk
            size_limit       ///< A parse_options limit was exceeded
        };

        chunk_parse_error(reason r, const std::string& msg)
            : pngchunk_error(msg), m_reason(r) {}

        [[nodiscard]] reason why() const noexcept { return m_reason; }

    private:
        reason m_reason;
    };

    /**
     * @class format_error
     * @brief Input does not start with the PNG signature
     */
    class format_error : public pngchunk_error {
    public:
        explicit format_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class not_found_error
     * @brief No chunk of the requested type exists
     */
    class not_found_error : public pngchunk_error {
    public:
        explicit not_found_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class data_error
     * @brief Chunk payload disagrees with its declared length
     */
    class data_error : public pngchunk_error {
    public:
        explicit data_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_TYPE(...) \
        throw ::pngchunk::type_parse_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK
     * @brief Throw a chunk_parse_error with the given reason
     * @param why Enumerator of chunk_parse_error::reason
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK(why, ...) \
        throw ::pngchunk::chunk_parse_error(::pngchunk::chunk_parse_error::reason::why, \
                                            ::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT(...) \
        throw ::pngchunk::format_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_NOT_FOUND(...) \
        throw ::pngchunk::not_found_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_DATA(...) \
        throw ::pngchunk::data_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_parse_error
     */
    #define THROW_CHUNK_IF(condition, why, ...) \
        do { if (condition) THROW_CHUNK(why, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
