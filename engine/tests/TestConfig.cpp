/**
 * @file TestConfig.cpp
 * @brief Config builder defaults and validation.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/engine/Config.hpp>

namespace cinder::engine {

using namespace std::chrono_literals;

TEST_CASE("Builder defaults form a valid two-player session", "[config]")
{
    const auto config = Config::Builder{}.build();

    REQUIRE(config.validate().has_value());
    REQUIRE(config.playerCount() == 2);
    REQUIRE(config.localPlayer() == 0);
    REQUIRE(config.localPlayerMask() == 0b0001);
    REQUIRE(config.syncConfig().windowSize == 32);
    REQUIRE(config.syncConfig().syncTimeout == 15000ms);
    REQUIRE(config.saveConfig().mode == save::SaveMode::PerPlayer);
}

TEST_CASE("Builder values reach the sync configuration", "[config]")
{
    const auto config = Config::Builder{}
                            .playerCount(4)
                            .localPlayer(3)
                            .initialRetransmitTimeout(20ms)
                            .maxRetransmitTimeout(400ms)
                            .windowSize(8)
                            .readyInterval(30ms)
                            .saveDirectory("/tmp/cinder")
                            .saveConfig(save::SaveConfig{save::SaveMode::NewGame, std::nullopt})
                            .build();

    REQUIRE(config.validate().has_value());
    REQUIRE(config.localPlayerMask() == 0b1000);
    REQUIRE(config.syncConfig().initialRetransmitTimeout == 20ms);
    REQUIRE(config.syncConfig().maxRetransmitTimeout == 400ms);
    REQUIRE(config.syncConfig().windowSize == 8);
    REQUIRE(config.syncConfig().readyInterval == 30ms);
    REQUIRE(config.saveDirectory() == std::filesystem::path{"/tmp/cinder"});
    REQUIRE(config.saveConfig().mode == save::SaveMode::NewGame);
}

TEST_CASE("validate rejects unusable sessions", "[config]")
{
    const auto rejected = [](const Config::Builder &builder) {
        const auto result = builder.build().validate();
        return !result && result.error().code() == core::ErrorCode::kInvalidArgument;
    };

    REQUIRE(rejected(Config::Builder{}.playerCount(0)));
    REQUIRE(rejected(Config::Builder{}.playerCount(5)));
    REQUIRE(rejected(Config::Builder{}.playerCount(2).localPlayer(2)));
    REQUIRE(rejected(Config::Builder{}.windowSize(0)));
    REQUIRE(rejected(Config::Builder{}.windowSize(33)));
    REQUIRE(rejected(Config::Builder{}.initialRetransmitTimeout(0ms)));
    REQUIRE(rejected(Config::Builder{}.initialRetransmitTimeout(500ms).maxRetransmitTimeout(100ms)));
}

} // namespace cinder::engine
