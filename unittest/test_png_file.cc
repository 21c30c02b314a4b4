#include <doctest/doctest.h>
#include <pngme/png_file.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"
#include "unittest_config.h"

using namespace pngme;

namespace {
    png_file testing_png() {
        std::vector<chunk> chunks{
            chunk("FrSt"_chunk, std::string_view("I am the first chunk")),
            chunk("miDl"_chunk, std::string_view("I am another chunk")),
            chunk("LASt"_chunk, std::string_view("I am the last chunk"))
        };
        return png_file(std::move(chunks));
    }

    error_kind parse_failure(const std::vector<std::byte>& bytes) {
        try {
            (void)png_file::parse(bytes);
        } catch (const parse_error& e) {
            return e.kind();
        }
        FAIL("png_file::parse did not throw");
        return error_kind::chunk_not_found;
    }
}

TEST_SUITE("PNG_FILE") {
    TEST_CASE("construction from chunks") {
        const auto png = testing_png();
        CHECK(png.chunks().size() == 3);
        CHECK(png.header() == png_signature);
        CHECK(png_file().chunks().empty());
    }

    TEST_CASE("real file") {
        const auto data = load_test_data("tiny.png");
        const auto png = png_file::parse(data);

        REQUIRE(png.chunks().size() == 4);
        CHECK(png.chunks().front().type() == chunk_types::IHDR);
        CHECK(png.chunks().front().length() == 13);
        CHECK(png.chunks().back().type() == chunk_types::IEND);

        SUBCASE("serializes back to the same bytes") {
            CHECK(png.serialize() == data);
        }

        SUBCASE("text chunk") {
            const auto* text = png.chunk_by_type(chunk_types::tEXt);
            REQUIRE(text != nullptr);
            const std::string expected("Comment\0pngme test image", 24);
            CHECK(text->data_as_text() == expected);
        }

        SUBCASE("load from path") {
            const auto loaded = png_file::load(std::filesystem::path(UNITTEST_PATH_TO_DATA) / "tiny.png");
            CHECK(loaded.chunks() == png.chunks());
        }

        SUBCASE("load from stream") {
            std::istringstream stream(std::string(reinterpret_cast<const char*>(data.data()), data.size()));
            CHECK(png_file::load(stream).chunks() == png.chunks());
        }
    }

    TEST_CASE("invalid input") {
        SUBCASE("bad signature") {
            auto bytes = testing_png().serialize();
            bytes[1] = std::byte('p');
            CHECK(parse_failure(bytes) == error_kind::invalid_signature);
        }

        SUBCASE("too short for a signature") {
            CHECK(parse_failure(std::vector<std::byte>(7, std::byte(137))) == error_kind::too_short);
        }

        SUBCASE("signature only") {
            auto bytes = png_file().serialize();
            CHECK(bytes.size() == 8);
            CHECK(png_file::parse(bytes).chunks().empty());
        }

        SUBCASE("corrupted chunk") {
            auto bytes = testing_png().serialize();
            bytes[8 + 8] ^= std::byte(0x20);
            CHECK(parse_failure(bytes) == error_kind::crc_mismatch);
        }

        SUBCASE("corrupted chunk, lenient") {
            auto bytes = testing_png().serialize();
            // payload of the second chunk
            bytes[8 + 32 + 8] ^= std::byte(0x20);

            parse_options opts;
            opts.strict = false;
            std::string category;
            opts.on_warning = [&category](std::uint64_t, std::string_view c, std::string_view) {
                category = std::string(c);
            };

            const auto png = png_file::parse(bytes, opts);
            CHECK(png.chunks().size() == 1);
            CHECK(category == "crc_mismatch");
        }
    }

    TEST_CASE("editing") {
        auto png = testing_png();

        SUBCASE("append") {
            png.append_chunk(chunk("TeSt"_chunk, std::string_view("Message")));
            REQUIRE(png.chunks().size() == 4);
            CHECK(png.chunks().back().data_as_text() == "Message");
        }

        SUBCASE("find") {
            const auto* c = png.chunk_by_type("FrSt"_chunk);
            REQUIRE(c != nullptr);
            CHECK(c->data_as_text() == "I am the first chunk");
            CHECK(png.chunk_by_type("NoNe"_chunk) == nullptr);
        }

        SUBCASE("remove first of a type") {
            png.append_chunk(chunk("miDl"_chunk, std::string_view("second of its type")));

            const auto removed = png.remove_first_chunk("miDl"_chunk);
            CHECK(removed.data_as_text() == "I am another chunk");
            REQUIRE(png.chunks().size() == 3);

            const auto* remaining = png.chunk_by_type("miDl"_chunk);
            REQUIRE(remaining != nullptr);
            CHECK(remaining->data_as_text() == "second of its type");
        }

        SUBCASE("remove missing type") {
            CHECK_THROWS_AS(png.remove_first_chunk("NoNe"_chunk), parse_error);
            CHECK(png.chunks().size() == 3);
        }

        SUBCASE("round trip through bytes") {
            png.append_chunk(chunk("ruSt"_chunk, std::string_view(secret_message)));
            const auto reparsed = png_file::parse(png.serialize());
            CHECK(reparsed.chunks() == png.chunks());
        }
    }

    TEST_CASE("save") {
        const auto png = testing_png();

        SUBCASE("to stream") {
            std::ostringstream out;
            png.save(out);
            const auto bytes = png.serialize();
            CHECK(out.str() == std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        }

        SUBCASE("to file and back") {
            const auto path = std::filesystem::temp_directory_path() / "pngme_unittest_save.png";
            png.save(path);
            const auto loaded = png_file::load(path);
            std::filesystem::remove(path);
            CHECK(loaded.chunks() == png.chunks());
        }

        SUBCASE("to an unwritable path") {
            CHECK_THROWS_AS(png.save(std::filesystem::path("/nonexistent/dir/out.png")), io_error);
        }
    }
}
