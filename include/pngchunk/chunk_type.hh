//
// Created on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>

#include <pngchunk/exceptions.hh>

namespace pngchunk {
    /**
     * @class chunk_type
     * @brief Four letter PNG chunk type code
     *
     * Every byte must be an ASCII letter. Bit 5 (0x20) of each byte
     * carries one property flag: uppercase means the bit is clear,
     * lowercase means it is set.
     */
    class chunk_type {
    public:
        static constexpr std::uint8_t property_bit = 0x20;

        // Constructor from raw bytes, first byte is the leftmost letter
        explicit chunk_type(const std::array<std::uint8_t, 4>& bytes)
            : b(bytes) {
            for (std::size_t i = 0; i < b.size(); ++i) {
                if (!is_letter(b[i])) {
                    THROW_TYPE("Invalid chunk type byte ", static_cast<unsigned>(b[i]),
                               " at position ", i, ": chunk type bytes must be ASCII letters");
                }
            }
        }

        // Constructor from a four character code such as "IHDR"
        explicit chunk_type(std::string_view code)
            : chunk_type(bytes_of(code)) {}

        // Constructor from C-string
        explicit chunk_type(const char* code) : chunk_type(std::string_view(code)) {}

        // Constructor from raw bytes in memory (exactly 4 are read)
        static chunk_type from_bytes(const void* data) {
            std::array<std::uint8_t, 4> bytes{};
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        [[nodiscard]] std::array<std::uint8_t, 4> to_bytes() const {
            return b;
        }

        // Write to bytes
        void write_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Ancillary chunks have a lowercase first letter
        [[nodiscard]] bool is_critical() const {
            return (b[0] & property_bit) == 0;
        }

        // Private chunks have a lowercase second letter
        [[nodiscard]] bool is_public() const {
            return (b[1] & property_bit) == 0;
        }

        // Reserved for future PNG versions, must be uppercase.
        // Informational only: a lowercase third letter is still a valid type.
        [[nodiscard]] bool is_reserved_bit_valid() const {
            return (b[2] & property_bit) == 0;
        }

        [[nodiscard]] bool is_safe_to_copy() const {
            return (b[3] & property_bit) != 0;
        }

        std::uint8_t operator[](std::size_t i) const { return b[i]; }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string_view();
        }

    private:
        static constexpr bool is_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        static std::array<std::uint8_t, 4> bytes_of(std::string_view code) {
            if (code.size() != 4) {
                THROW_TYPE("Chunk type code '", code, "' must be exactly 4 characters, got ",
                           code.size());
            }
            std::array<std::uint8_t, 4> bytes{};
            std::transform(code.begin(), code.end(), bytes.begin(), [](char c) {
                return static_cast<std::uint8_t>(c);
            });
            return bytes;
        }

        std::array<std::uint8_t, 4> b;
    };

    // User-defined literal for chunk type codes, e.g. "IEND"_ct
    inline chunk_type operator""_ct(const char* str, std::size_t len) {
        return chunk_type(std::string_view(str, len));
    }

}
