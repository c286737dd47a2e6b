// /////////////////////////////////////////////////////////////////////////////
/// @file TestLineAssembler.cpp
/// @brief Unit tests for LineAssembler.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include <seis/protocol/LineAssembler.hpp>

using namespace seis::protocol;

TEST_CASE("LineAssembler: units split across chunks", "[protocol][lines]")
{
    LineAssembler assembler;

    CHECK(assembler.feed("X1,2").empty());
    CHECK(assembler.hasPartial());

    auto lines = assembler.feed(",3\r\nY4");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "X1,2,3");

    lines = assembler.feed("\n\n\r\n5\n");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "Y4");
    CHECK(lines[1] == "5");
    CHECK_FALSE(assembler.hasPartial());
}

TEST_CASE("LineAssembler: flush returns the trailing partial unit", "[protocol][lines]")
{
    LineAssembler assembler;
    CHECK(assembler.feed("1.5\n2.5").size() == 1);

    auto rest = assembler.flush();
    REQUIRE(rest.has_value());
    CHECK(*rest == "2.5");
    CHECK_FALSE(assembler.flush().has_value());
}

TEST_CASE("LineAssembler: overlong unit is discarded up to its terminator", "[protocol][lines]")
{
    LineAssembler assembler{8};

    auto lines = assembler.feed("123456789012");
    CHECK(lines.empty());
    CHECK(assembler.overflowCount() == 1);

    lines = assembler.feed("345\n42\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "42");

    CHECK(assembler.feed("abcdefgh\n").size() == 1);
    CHECK(assembler.overflowCount() == 1);
}

TEST_CASE("LineAssembler: reset drops buffered text", "[protocol][lines]")
{
    LineAssembler assembler;
    CHECK(assembler.feed("partial").empty());
    assembler.reset();
    auto lines = assembler.feed("next\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "next");
}
