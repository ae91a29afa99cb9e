/**
 * @file TestExpected.cpp
 * @brief Unit tests for core::Expected, the LTR_TRY macros and Log.
 */

#include <catch2/catch.hpp>

#include "ltr/core/Expected.hpp"
#include "ltr/core/Log.hpp"

#include <string>
#include <vector>

namespace ltr::core {

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int checked = LTR_TRY(parsePositive(value));
    return checked * 2;
}

Expected<void> requirePositive(int value)
{
    LTR_TRY_VOID(parsePositive(value));
    return {};
}

struct CapturingLogger final : ILogger {
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("LTR_TRY unwraps values and propagates errors", "[core][expected]")
{
    REQUIRE(doubled(21).value() == 42);

    const auto failed = doubled(-1);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(failed.error().message() == "not positive");
}

TEST_CASE("LTR_TRY_VOID propagates errors from void contexts", "[core][expected]")
{
    REQUIRE(requirePositive(3).has_value());
    REQUIRE(requirePositive(0).error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("ErrorCode names are stable", "[core][error]")
{
    REQUIRE(toString(ErrorCode::kNetworkSendFailed) == "NetworkSendFailed");
    REQUIRE(toString(ErrorCode::kBootstrapFailed) == "BootstrapFailed");
}

TEST_CASE("Log filters by severity and forwards tags", "[core][log]")
{
    CapturingLogger logger;
    const auto previous = Log::minLevel();
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("NET", "dropped");
    Log::warn("NET", "kept");
    Log::error("lost peer");

    Log::setLogger(nullptr);
    Log::setMinLevel(previous);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].tag == "NET");
    REQUIRE(logger.entries[0].message == "kept");
    REQUIRE(logger.entries[1].level == LogLevel::kError);
    REQUIRE(logger.entries[1].tag == "ltr");
}

TEST_CASE("Log level names are fixed width", "[core][log]")
{
    REQUIRE(toString(LogLevel::kInfo) == "INFO ");
    REQUIRE(toString(LogLevel::kFatal) == "FATAL");
    REQUIRE(toString(LogLevel::kWarn).size() == toString(LogLevel::kDebug).size());
}

} // namespace ltr::core
