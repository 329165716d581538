#include <doctest/doctest.h>
#include <pngchunk/crc.hh>
#include <pngchunk/chunk.hh>

#include <string>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("CRC") {
    TEST_CASE("crc32 check value") {
        // CRC-32/ISO-HDLC catalogue check value
        const std::string check = "123456789";
        CHECK(crc32::compute(check.data(), check.size()) == 0xCBF43926u);
    }

    TEST_CASE("crc32 of empty input is zero") {
        CHECK(crc32().value() == 0u);
        CHECK(crc32::compute(nullptr, 0) == 0u);
    }

    TEST_CASE("crc32 incremental updates match one-shot") {
        const std::string text = "RuStThis is where your secret message will be!";
        crc32 crc;
        crc.update(text.data(), 4).update(text.data() + 4, text.size() - 4);
        CHECK(crc.value() == crc32::compute(text.data(), text.size()));
        CHECK(crc.value() == secret_message_crc);
    }

    TEST_CASE("chunk crc covers type and data") {
        auto data = to_bytes(secret_message);
        CHECK(chunk::compute_crc(chunk_type("RuSt"), data.data(), data.size()) == secret_message_crc);

        SUBCASE("different type changes the crc") {
            CHECK(chunk::compute_crc(chunk_type("RuST"), data.data(), data.size()) != secret_message_crc);
        }

        SUBCASE("single flipped data byte changes the crc") {
            data[10] ^= std::byte{0x01};
            CHECK(chunk::compute_crc(chunk_type("RuSt"), data.data(), data.size()) != secret_message_crc);
        }

        SUBCASE("deterministic") {
            auto first = chunk::compute_crc(chunk_type("RuSt"), data.data(), data.size());
            auto second = chunk::compute_crc(chunk_type("RuSt"), data.data(), data.size());
            CHECK(first == second);
        }
    }
}
