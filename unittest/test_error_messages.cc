//
// Error messages carry the offending values
//

#include <doctest/doctest.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <pngme/png_file.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Improved error messages") {
    SUBCASE("crc mismatch - shows chunk, stored and computed values") {
        try {
            (void)chunk::parse(make_record(42, "RuSt", secret_message, 1234));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(e.kind() == error_kind::crc_mismatch);
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("1234") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("length overflow - shows declared and available sizes") {
        try {
            (void)chunk::parse_next(make_record(1000, "RuSt", secret_message, 0));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("1000") != std::string::npos);
            CHECK(msg.find("42") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("invalid character - shows position and value") {
        try {
            (void)chunk_type::from_string("Ru1t");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("byte 2") != std::string::npos);
            CHECK(msg.find("49") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("wrong length - shows the tag and its size") {
        try {
            (void)chunk_type::from_string("PNGME");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("PNGME") != std::string::npos);
            CHECK(msg.find("5 bytes") != std::string::npos);
        }
    }

    SUBCASE("length mismatch - shows declared and actual data sizes") {
        try {
            (void)chunk::parse(make_record(41, "RuSt", secret_message, secret_message_crc));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(e.kind() == error_kind::length_mismatch);
            CHECK(msg.find("length 41") != std::string::npos);
            CHECK(msg.find("42 bytes") != std::string::npos);
        }
    }

    SUBCASE("chunk not found - names the type") {
        png_file file;
        try {
            (void)file.remove_first_chunk("ruSt"_chunk);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::chunk_not_found);
            CHECK(std::string(e.what()).find("ruSt") != std::string::npos);
        }
    }
}

TEST_CASE("Error kind names") {
    CHECK(to_string(error_kind::invalid_character) == "invalid_character");
    CHECK(to_string(error_kind::wrong_length) == "wrong_length");
    CHECK(to_string(error_kind::too_short) == "too_short");
    CHECK(to_string(error_kind::length_mismatch) == "length_mismatch");
    CHECK(to_string(error_kind::length_exceeds_buffer) == "length_exceeds_buffer");
    CHECK(to_string(error_kind::trailing_data) == "trailing_data");
    CHECK(to_string(error_kind::crc_mismatch) == "crc_mismatch");
    CHECK(to_string(error_kind::invalid_encoding) == "invalid_encoding");
    CHECK(to_string(error_kind::invalid_signature) == "invalid_signature");
    CHECK(to_string(error_kind::chunk_not_found) == "chunk_not_found");
}

TEST_CASE("Exception hierarchy") {
    CHECK_THROWS_AS(chunk_type::from_string("x"), pngme_error);
    CHECK_THROWS_AS(chunk_type::from_string("x"), std::runtime_error);
    CHECK_THROWS_AS(png_file::load(std::filesystem::path("/nonexistent/dir/file.png")), io_error);
}
