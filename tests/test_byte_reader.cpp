/**
 * @file test_byte_reader.cpp
 * @brief Unit tests for ByteReader and the byte sources.
 */

#include <catch2/catch_test_macros.hpp>
#include <flowtuple/byte_reader.hpp>
#include <flowtuple/byte_source.hpp>

#include "wire_builder.hpp"

#include <sstream>
#include <string>

using namespace flowtuple;
using flowtuple::testing::ChunkedSource;
using flowtuple::testing::FailingSource;

TEST_CASE("MemorySource position and remaining", "[bytesource]") {
    std::uint8_t data[] = {0x01, 0x02, 0x03};
    MemorySource source(data, sizeof(data));

    REQUIRE(source.position() == 0);
    REQUIRE(source.remaining() == 3);

    std::uint8_t out[8] = {0};
    std::size_t got = 0;

    SECTION("read less than available") {
        REQUIRE(source.read(out, 2, got) == Error::Ok);
        REQUIRE(got == 2);
        REQUIRE(out[0] == 0x01);
        REQUIRE(out[1] == 0x02);
        REQUIRE(source.position() == 2);
        REQUIRE(source.remaining() == 1);
    }

    SECTION("read more than available") {
        REQUIRE(source.read(out, 8, got) == Error::Ok);
        REQUIRE(got == 3);
        REQUIRE(source.remaining() == 0);

        REQUIRE(source.read(out, 8, got) == Error::Ok);
        REQUIRE(got == 0);
    }
}

TEST_CASE("StreamSource reads from istream", "[bytesource]") {
    std::string text("\xDE\xAD\xBE\xEF", 4);
    std::istringstream in(text);
    StreamSource source(in);

    std::uint8_t out[8] = {0};
    std::size_t got = 0;

    SECTION("short read at end of stream is not an error") {
        REQUIRE(source.read(out, 8, got) == Error::Ok);
        REQUIRE(got == 4);
        REQUIRE(out[0] == 0xDE);
        REQUIRE(out[3] == 0xEF);

        REQUIRE(source.read(out, 8, got) == Error::Ok);
        REQUIRE(got == 0);
    }

    SECTION("bad stream reports Io") {
        in.setstate(std::ios::badbit);
        REQUIRE(source.read(out, 4, got) == Error::Io);
        REQUIRE(got == 0);
    }

    SECTION("stream with exceptions enabled") {
        in.exceptions(std::ios::failbit | std::ios::eofbit);
        REQUIRE(source.read(out, 8, got) == Error::Ok);
        REQUIRE(got == 4);
    }
}

TEST_CASE("ByteReader big-endian fields", "[bytereader]") {
    std::uint8_t data[] = {0xAB, 0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF};
    MemorySource source(data, sizeof(data));
    ByteReader reader(source);

    std::uint8_t u8 = 0;
    std::uint16_t u16 = 0;
    std::uint32_t u32 = 0;

    REQUIRE(reader.read_u8(u8) == Error::Ok);
    REQUIRE(u8 == 0xAB);
    REQUIRE(reader.read_u16(u16) == Error::Ok);
    REQUIRE(u16 == 0x1234);
    REQUIRE(reader.read_u32(u32) == Error::Ok);
    REQUIRE(u32 == 0xDEADBEEF);
    REQUIRE(reader.offset() == 7);
}

TEST_CASE("ByteReader load_u32", "[bytereader]") {
    std::uint8_t data[] = {0x00, 0x0A, 0x0B, 0x0C};
    REQUIRE(ByteReader::load_u32(data) == 0x000A0B0CU);
}

TEST_CASE("ByteReader short read", "[bytereader]") {
    std::uint8_t data[] = {0x12, 0x34, 0x56};
    MemorySource source(data, sizeof(data));
    ByteReader reader(source);

    std::uint32_t value = 0xFFFFFFFFU;
    REQUIRE(reader.read_u32(value) == Error::ShortRead);
    REQUIRE(value == 0xFFFFFFFFU);
    // Partial bytes still count as consumed
    REQUIRE(reader.offset() == 3);
}

TEST_CASE("ByteReader read_exact over empty source", "[bytereader]") {
    MemorySource source(nullptr, 0);
    ByteReader reader(source);

    std::uint8_t buf[1];
    REQUIRE(reader.read_exact(buf, 1) == Error::ShortRead);
    REQUIRE(reader.read_exact(buf, 0) == Error::Ok);
    REQUIRE(reader.offset() == 0);
}

TEST_CASE("ByteReader assembles fields from partial reads", "[bytereader]") {
    std::vector<std::uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x02};
    ChunkedSource source(data, 1);
    ByteReader reader(source);

    std::uint32_t u32 = 0;
    std::uint16_t u16 = 0;
    REQUIRE(reader.read_u32(u32) == Error::Ok);
    REQUIRE(u32 == 0xDEADBEEF);
    REQUIRE(reader.read_u16(u16) == Error::Ok);
    REQUIRE(u16 == 0x0102);
    REQUIRE(source.calls() == 6);
}

TEST_CASE("ByteReader propagates source failure", "[bytereader]") {
    std::vector<std::uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    FailingSource source(data, 2);
    ByteReader reader(source);

    std::uint32_t value = 0;
    REQUIRE(reader.read_u32(value) == Error::Io);
    REQUIRE(reader.offset() == 2);
}
