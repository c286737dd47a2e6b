/**
 * @file TestError.cpp
 * @brief Unit tests for Error, Expected and the propagation macros.
 * @author MasterLaplace
 */

#include <catch2/catch_test_macros.hpp>

#include <seis/core/Expected.hpp>

#include <string>

using namespace seis::core;

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int v = SEIS_TRY(parsePositive(value));
    return v * 2;
}

ExpectedVoid checked(int value)
{
    SEIS_TRY_VOID(parsePositive(value).transform([](int) {}));
    return {};
}

} // namespace

TEST_CASE("Error: format carries code, message and origin", "[core][error]")
{
    const Error error{ErrorCode::kLineTooLong, "line too long"};

    CHECK(error.code() == ErrorCode::kLineTooLong);
    CHECK(error.message() == "line too long");

    const std::string text = error.format();
    CHECK(text.rfind("[LineTooLong] line too long (", 0) == 0);
    CHECK(text.find("TestError.cpp:") != std::string::npos);
}

TEST_CASE("Error: every code has a name", "[core][error]")
{
    CHECK(errorCodeName(ErrorCode::kNone) == "None");
    CHECK(errorCodeName(ErrorCode::kReaderLocked) == "ReaderLocked");
    CHECK(errorCodeName(ErrorCode::kOrphanChannelMarker) == "OrphanChannelMarker");
    CHECK(errorCodeName(ErrorCode::kInternalError) == "InternalError");
    CHECK(errorCodeName(static_cast<ErrorCode>(0xFFFF)) == "Unknown");
}

TEST_CASE("SEIS_TRY: yields the value or returns the error", "[core][error]")
{
    auto ok = doubled(21);
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    auto bad = doubled(-1);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("SEIS_TRY_VOID: propagates the error unchanged", "[core][error]")
{
    CHECK(checked(3).has_value());

    auto bad = checked(0);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().message() == "not positive");
}
