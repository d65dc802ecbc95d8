#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("chunk construction") {
    SUBCASE("length and crc computed") {
        chunk c("RuSt"_ct, bytes_of(secret_message));
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_message_crc);
        CHECK(c.type() == "RuSt"_ct);
        CHECK(c.data() == bytes_of(secret_message));
        CHECK(c.total_size() == 54);
    }

    SUBCASE("empty payload") {
        chunk c("IEND"_ct, {});
        CHECK(c.length() == 0);
        CHECK(c.crc() == iend_crc);
        CHECK(c.data().empty());
        CHECK(c.total_size() == chunk::envelope_size);
    }

    SUBCASE("shared crc routine") {
        auto payload = bytes_of("hello");
        chunk c("teSt"_ct, payload);
        CHECK(c.crc() == crc32("teSt"_ct, payload.data(), payload.size()));
        CHECK(crc32("IEND"_ct, nullptr, 0) == iend_crc);
    }
}

TEST_CASE("chunk parsing") {
    SUBCASE("valid record") {
        auto c = chunk::parse(rust_record());
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.crc() == secret_message_crc);
    }

    SUBCASE("from pointer and size") {
        auto record = iend_record();
        auto c = chunk::parse(record.data(), record.size());
        CHECK(c.type() == "IEND"_ct);
        CHECK(c.length() == 0);
    }

    SUBCASE("wrong crc") {
        auto record = make_record(42, "RuSt", secret_message, secret_message_crc - 1);
        try {
            chunk::parse(record);
            FAIL("Should have thrown exception");
        } catch (const chunk_parse_error& e) {
            CHECK(e.why() == chunk_parse_error::reason::crc_mismatch);
        }
    }

    SUBCASE("too short") {
        std::vector<std::byte> record(11, std::byte(0));
        try {
            chunk::parse(record);
            FAIL("Should have thrown exception");
        } catch (const chunk_parse_error& e) {
            CHECK(e.why() == chunk_parse_error::reason::too_short);
        }
        CHECK_THROWS_AS(chunk::parse(std::vector<std::byte>{}), chunk_parse_error);
    }

    SUBCASE("length field larger than payload") {
        auto record = make_record(43, "RuSt", secret_message, secret_message_crc);
        try {
            chunk::parse(record);
            FAIL("Should have thrown exception");
        } catch (const chunk_parse_error& e) {
            CHECK(e.why() == chunk_parse_error::reason::length_mismatch);
        }
    }

    SUBCASE("length field smaller than payload") {
        auto record = make_record(41, "RuSt", secret_message, secret_message_crc);
        CHECK_THROWS_AS(chunk::parse(record), chunk_parse_error);
    }

    SUBCASE("invalid type bytes") {
        auto record = make_record(0, "Ru1t", "", 0);
        try {
            chunk::parse(record);
            FAIL("Should have thrown exception");
        } catch (const chunk_parse_error& e) {
            CHECK(e.why() == chunk_parse_error::reason::invalid_type);
        }
    }
}

TEST_CASE("chunk checksum sensitivity") {
    const auto original = rust_record();

    // Every bit of type and payload, CRC held fixed
    for (std::size_t i = 4; i < original.size() - 4; ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto corrupted = original;
            corrupted[i] ^= std::byte(1u << bit);
            CAPTURE(i);
            CAPTURE(bit);
            CHECK_THROWS_AS(chunk::parse(corrupted), chunk_parse_error);
        }
    }
}

TEST_CASE("chunk serialization") {
    SUBCASE("parsed record serializes to the same bytes") {
        auto record = rust_record();
        CHECK(chunk::parse(record).serialize() == record);
    }

    SUBCASE("constructed chunk round trips") {
        chunk c("teSt"_ct, bytes_of("hello"));
        auto parsed = chunk::parse(c.serialize());
        CHECK(parsed == c);
        CHECK(parsed.length() == c.length());
        CHECK(parsed.crc() == c.crc());
    }

    SUBCASE("layout") {
        chunk c("IEND"_ct, {});
        CHECK(c.serialize() == iend_record());
    }

    SUBCASE("serialize_to appends") {
        std::vector<std::byte> out = bytes_of("xy");
        chunk("IEND"_ct, {}).serialize_to(out);
        REQUIRE(out.size() == 14);
        CHECK(out[0] == std::byte('x'));
        CHECK(std::vector<std::byte>(out.begin() + 2, out.end()) == iend_record());
    }
}

TEST_CASE("chunk text") {
    SUBCASE("data_as_string") {
        chunk c("teSt"_ct, bytes_of("hello"));
        CHECK(c.data_as_string() == "hello");
    }

    SUBCASE("bytes map one to one") {
        std::vector<std::byte> payload{std::byte(0x41), std::byte(0xE9), std::byte(0x00)};
        chunk c("raWd"_ct, payload);
        auto text = c.data_as_string();
        REQUIRE(text.size() == 3);
        CHECK(text[0] == 'A');
        CHECK(static_cast<unsigned char>(text[1]) == 0xE9);
        CHECK(text[2] == '\0');
    }

    SUBCASE("stream output") {
        std::ostringstream oss;
        oss << chunk::parse(rust_record());
        CHECK(oss.str() == secret_message);
    }
}

TEST_CASE("chunk equality") {
    chunk a("teSt"_ct, bytes_of("hello"));
    chunk b("teSt"_ct, bytes_of("hello"));
    chunk c("teSt"_ct, bytes_of("world"));
    chunk d("teST"_ct, bytes_of("hello"));
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}
