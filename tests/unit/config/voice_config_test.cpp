// =============================================================================
// Config Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>

#include "internal/voice_config.hpp"
#include "voice_api.hpp"

using namespace voice;

TEST_CASE("EngineConfig defaults and factories", "[config]") {
    auto config = EngineConfig::Default();
    REQUIRE(config.engine == "tone");
    REQUIRE(config.sample_rate == 22050);
    REQUIRE_FALSE(config.usesMemoryStore());
    REQUIRE(config.validate().isOk());

    REQUIRE(EngineConfig::InMemory().usesMemoryStore());

    auto http = EngineConfig::Http("http://localhost:8080");
    REQUIRE(http.engine == "http");
    REQUIRE(http.http_endpoint == "http://localhost:8080");
    REQUIRE(http.validate().isOk());
}

TEST_CASE("EngineConfig builders return modified copies", "[config]") {
    auto base = EngineConfig::Default();
    auto changed = base.withEngine("http").withLanguage("de-DE").withSampleRate(16000)
        .withStoragePath("/tmp/p").withOutputDir("/tmp/o").withApiKey("secret");

    REQUIRE(base.engine == "tone");
    REQUIRE(changed.engine == "http");
    REQUIRE(changed.language == "de-DE");
    REQUIRE(changed.sample_rate == 16000);
    REQUIRE(changed.storage_path == "/tmp/p");
    REQUIRE(changed.output_dir == "/tmp/o");
    REQUIRE(changed.api_key == "secret");
}

TEST_CASE("EngineConfig::validate", "[config]") {
    REQUIRE(EngineConfig().withEngine("").validate().code == ErrorCode::INVALID_ARGUMENT);
    REQUIRE(EngineConfig().withSampleRate(-1).validate().code == ErrorCode::INVALID_ARGUMENT);
    REQUIRE(EngineConfig().withEngine("http").validate().code == ErrorCode::INVALID_ARGUMENT);

    auto config = EngineConfig();
    config.http_timeout_ms = 0;
    REQUIRE(config.validate().code == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("EngineConfig expands the home directory", "[config]") {
    setenv("HOME", "/tmp/vox_home", 1);

    auto config = EngineConfig().withStoragePath("~/profiles").withOutputDir("~/out");
    REQUIRE(config.getExpandedStoragePath() == "/tmp/vox_home/profiles");
    REQUIRE(config.getExpandedOutputDir() == "/tmp/vox_home/out");

    REQUIRE(EngineConfig().withStoragePath("/abs").getExpandedStoragePath() == "/abs");
}

TEST_CASE("Public VoiceConfig mirrors the engine config", "[config][api]") {
    auto config = Vox::VoiceConfig::InMemory().withSampleRate(16000).withOutputDir("/tmp/x");
    REQUIRE(config.storage_path.empty());
    REQUIRE(config.sample_rate == 16000);
    REQUIRE(config.output_dir == "/tmp/x");

    auto http = Vox::VoiceConfig::Http("http://tts.local").withApiKey("k");
    REQUIRE(http.engine == "http");
    REQUIRE(http.api_key == "k");
    REQUIRE(Vox::VoiceConfig::Default().storage_path == "~/.cache/vox-studio/profiles");
}
