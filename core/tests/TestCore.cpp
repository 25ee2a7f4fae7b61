/**
 * @file TestCore.cpp
 * @brief Error propagation and logging façade.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/core/Expected.hpp>
#include <cinder/core/Log.hpp>

#include <initializer_list>
#include <string>
#include <vector>

namespace cinder::core {

namespace {

Expected<u32> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return static_cast<u32>(value);
}

Expected<u32> doubled(int value)
{
    const auto parsed = CINDER_TRY(parsePositive(value));
    return parsed * 2;
}

Expected<void> checkAll(std::initializer_list<int> values)
{
    for (int v : values)
        CINDER_TRY_VOID(parsePositive(v));
    return {};
}

struct CapturingLogger final : ILogger
{
    struct Entry
    {
        LogLevel    level;
        std::string tag;
        std::string message;
    };
    std::vector<Entry> entries;

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }
};

} // namespace

TEST_CASE("CINDER_TRY yields the value or propagates the error", "[core][error]")
{
    REQUIRE(doubled(21) == 42u);

    const auto failed = doubled(-1);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(failed.error().message() == "not positive");
    REQUIRE(std::string_view{failed.error().location().function_name()}.find("parsePositive") != std::string_view::npos);

    REQUIRE(checkAll({1, 2, 3}).has_value());
    REQUIRE(checkAll({1, 0, 3}).error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Error codes have stable names", "[core][error]")
{
    REQUIRE(toString(ErrorCode::kNone) == "None");
    REQUIRE(toString(ErrorCode::kTimeout) == "Timeout");
    REQUIRE(toString(ErrorCode::kSaveNotOwner) == "SaveNotOwner");
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CapturingLogger logger;
    const auto previous = Log::minLevel();
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("Arq", "dropped");
    Log::warn("Arq", "kept");
    Log::error("plain");

    Log::setLogger(nullptr);
    Log::setMinLevel(previous);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
    REQUIRE(logger.entries[0].tag == "Arq");
    REQUIRE(logger.entries[1].tag == "cinder");
    REQUIRE(logger.entries[1].message == "plain");
}

} // namespace cinder::core
