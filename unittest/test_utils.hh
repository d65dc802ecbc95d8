#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include "unittest_config.h"

// Bytes of a string, one byte per character
inline std::vector<std::byte> bytes_of(std::string_view s) {
    std::vector<std::byte> out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(static_cast<std::byte>(v >> 24));
    out.push_back(static_cast<std::byte>(v >> 16));
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

// Raw chunk record with every field under test control
inline std::vector<std::byte> make_record(std::uint32_t length, std::string_view type,
                                          std::string_view payload, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, length);
    auto t = bytes_of(type);
    out.insert(out.end(), t.begin(), t.end());
    auto p = bytes_of(payload);
    out.insert(out.end(), p.begin(), p.end());
    append_be32(out, crc);
    return out;
}

inline std::vector<std::byte> png_signature() {
    return {std::byte(0x89), std::byte('P'), std::byte('N'), std::byte('G'),
            std::byte(0x0D), std::byte(0x0A), std::byte(0x1A), std::byte(0x0A)};
}

// Signature followed by the given records
inline std::vector<std::byte> png_stream(std::initializer_list<std::vector<std::byte>> records) {
    std::vector<std::byte> out = png_signature();
    for (const auto& r : records) {
        out.insert(out.end(), r.begin(), r.end());
    }
    return out;
}

// Well known records
inline const std::string_view secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u;  // "RuSt" + secret_message
inline constexpr std::uint32_t iend_crc = 0xAE426082u;

inline std::vector<std::byte> rust_record() {
    return make_record(42, "RuSt", secret_message, secret_message_crc);
}

inline std::vector<std::byte> iend_record() {
    return make_record(0, "IEND", "", iend_crc);
}

// Fresh path inside the scratch directory of the test build
inline std::filesystem::path work_file(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_WORK_DIR);
    std::filesystem::create_directories(root);
    auto path = root / name;
    std::filesystem::remove(path);
    return path;
}
