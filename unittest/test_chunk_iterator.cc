#include <doctest/doctest.h>
#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::string build_stream(const std::vector<chunk>& chunks) {
        std::string out;
        for (const auto& c : chunks) {
            out += as_string(c.to_bytes());
        }
        return out;
    }

    std::vector<chunk> sample_chunks() {
        return {
            chunk(chunk_type("IHDR"), to_bytes("0123456789abc")),
            chunk(chunk_type("RuSt"), to_bytes(secret_message)),
            chunk(chunk_type("tEXt"), to_bytes("Comment: hello")),
            chunk(chunk_type("IEND"), {})
        };
    }
}

TEST_SUITE("CHUNK_ITERATOR") {
    TEST_CASE("iterates chunks in order with offsets") {
        auto chunks = sample_chunks();
        std::istringstream stream(build_stream(chunks));

        chunk_iterator it(stream);
        std::uint64_t expected_offset = 0;
        std::size_t index = 0;
        while (it.has_next()) {
            const auto& info = it.current();
            REQUIRE(index < chunks.size());
            REQUIRE(info.record.has_value());
            CHECK(info.offset == expected_offset);
            CHECK(*info.record == chunks[index]);

            expected_offset += info.record->size();
            ++index;
            it.next();
        }
        CHECK(index == chunks.size());
        CHECK(it.at_end());
        CHECK_FALSE(it.current().record.has_value());
    }

    TEST_CASE("empty stream has no chunks") {
        std::istringstream stream("");
        chunk_iterator it(stream);
        CHECK(it.at_end());
        CHECK_FALSE(it.has_next());

        // next() at the end is a no-op
        it.next();
        CHECK(it.at_end());
    }

    TEST_CASE("read_chunks collects everything") {
        auto chunks = sample_chunks();
        std::istringstream stream(build_stream(chunks));
        auto read = read_chunks(stream);
        CHECK(read == chunks);
    }

    TEST_CASE("iteration starts at the current stream position") {
        auto chunks = sample_chunks();
        std::istringstream stream("\x89PNG\r\n\x1a\n" + build_stream(chunks));
        stream.seekg(8);

        chunk_iterator it(stream);
        REQUIRE(it.has_next());
        CHECK(it.current().offset == 8);
        CHECK(it.current().record->type() == chunk_type("IHDR"));
    }

    TEST_CASE("strict mode throws on malformed chunks") {
        auto good = as_string(chunk(chunk_type("RuSt"), to_bytes(secret_message)).to_bytes());

        SUBCASE("crc mismatch") {
            auto bad = as_string(make_frame(42, "RuSt", secret_message, 2882656333u));
            std::istringstream stream(good + bad);
            chunk_iterator it(stream);
            REQUIRE(it.has_next());
            CHECK_THROWS_AS(it.next(), crc_error);
        }

        SUBCASE("invalid type") {
            auto bad = as_string(make_frame(2, "Ru1t", "ab", 0));
            std::istringstream stream(bad);
            CHECK_THROWS_AS(chunk_iterator{stream}, chunk_type_error);
        }

        SUBCASE("truncated header") {
            std::istringstream stream(good + std::string("\0\0\0", 3));
            chunk_iterator it(stream);
            REQUIRE(it.has_next());
            CHECK_THROWS_AS(it.next(), chunk_too_small_error);
        }

        SUBCASE("truncated body") {
            std::istringstream stream(good.substr(0, good.size() - 2));
            CHECK_THROWS_AS(chunk_iterator{stream}, data_length_error);
        }

        SUBCASE("length above max_chunk_size") {
            parse_options opts;
            opts.max_chunk_size = 16;
            std::istringstream stream(good);
            CHECK_THROWS_AS(chunk_iterator(stream, opts), data_length_error);
        }
    }

    TEST_CASE("lenient mode skips bad chunks") {
        auto first = chunk(chunk_type("IHDR"), to_bytes("header"));
        auto last = chunk(chunk_type("IEND"), {});

        parse_options opts;
        opts.strict = false;

        SUBCASE("crc mismatch") {
            auto bad = as_string(make_frame(42, "RuSt", secret_message, 2882656333u));
            std::istringstream stream(as_string(first.to_bytes()) + bad + as_string(last.to_bytes()));
            auto chunks = read_chunks(stream, opts);
            REQUIRE(chunks.size() == 2);
            CHECK(chunks[0] == first);
            CHECK(chunks[1] == last);
        }

        SUBCASE("invalid type") {
            auto bad = as_string(make_frame(2, "Ru1t", "ab", 0));
            std::istringstream stream(as_string(first.to_bytes()) + bad + as_string(last.to_bytes()));
            auto chunks = read_chunks(stream, opts);
            REQUIRE(chunks.size() == 2);
            CHECK(chunks[1] == last);
        }

        SUBCASE("oversized chunk") {
            opts.max_chunk_size = 16;
            auto big = chunk(chunk_type("RuSt"), to_bytes(secret_message));
            std::istringstream stream(as_string(first.to_bytes()) + as_string(big.to_bytes()) +
                                      as_string(last.to_bytes()));
            auto chunks = read_chunks(stream, opts);
            REQUIRE(chunks.size() == 2);
            CHECK(chunks[0] == first);
            CHECK(chunks[1] == last);
        }

        SUBCASE("truncated tail ends iteration") {
            auto tail = as_string(last.to_bytes());
            std::istringstream stream(as_string(first.to_bytes()) + tail.substr(0, 10));
            auto chunks = read_chunks(stream, opts);
            REQUIRE(chunks.size() == 1);
            CHECK(chunks[0] == first);
        }
    }

    TEST_CASE("huge declared length on a short stream does not allocate it") {
        // Claims 2 GiB - 1 but carries only a few bytes
        auto bad = make_frame(0x7FFFFFFFu, "RuSt", "abc", 0);
        std::istringstream stream(as_string(bad));
        CHECK_THROWS_AS(chunk_iterator{stream}, data_length_error);
    }
}
