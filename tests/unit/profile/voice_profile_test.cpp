// =============================================================================
// VoiceProfile Tests
// =============================================================================
// 校验规则、覆盖项、JSON 读写、ID 生成
// =============================================================================

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <vector>

#include "internal/profile/voice_profile.hpp"

using namespace voice;

namespace {

VoiceProfile validProfile() {
    VoiceProfile profile;
    profile.profile_id = "abc-123";
    profile.name = "Tester";
    profile.gender = "female";
    profile.pitch = 1.5f;
    profile.speed = 1.1f;
    profile.volume = 0.9f;
    profile.timbre = {{"warmth", 0.7f}, {"brightness", 0.2f}};
    profile.language = "en-GB";
    profile.accent = "british";
    profile.age_range = "young";
    profile.emotion_default = "calm";
    profile.custom_params = {{"tremolo", 0.3}};
    profile.created_at = "2026-01-01T00:00:00.000000";
    profile.updated_at = "2026-01-02T00:00:00.000000";
    return profile;
}

}  // namespace

TEST_CASE("VoiceProfile::validate accepts in-range profiles", "[profile][validate]") {
    REQUIRE(validProfile().validate().valid);

    SECTION("bounds are inclusive") {
        auto profile = validProfile();
        profile.pitch = -12.0f;
        profile.speed = 2.0f;
        profile.volume = 0.0f;
        profile.timbre = {{"warmth", 0.0f}, {"brightness", 1.0f}};
        REQUIRE(profile.validate().valid);
    }

    SECTION("empty age_range is allowed") {
        auto profile = validProfile();
        profile.age_range.clear();
        REQUIRE(profile.validate().valid);
    }
}

TEST_CASE("VoiceProfile::validate reports each violation", "[profile][validate]") {
    SECTION("pitch out of range") {
        auto profile = validProfile();
        profile.pitch = 15.0f;
        auto report = profile.validate();
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.errors.size() == 1);
        REQUIRE(report.errors[0] == "pitch: must be between -12.0 and +12.0 semitones (got 15.00)");
    }

    SECTION("all violations are collected") {
        auto profile = validProfile();
        profile.name.clear();
        profile.speed = 0.1f;
        profile.volume = 2.5f;
        profile.gender = "robot";
        profile.age_range = "teen";
        profile.timbre["warmth"] = 1.5f;

        auto report = profile.validate();
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.errors.size() == 6);

        auto has = [&](const std::string& prefix) {
            for (const auto& e : report.errors) {
                if (e.rfind(prefix, 0) == 0) return true;
            }
            return false;
        };
        REQUIRE(has("speed:"));
        REQUIRE(has("volume:"));
        REQUIRE(has("gender:"));
        REQUIRE(has("age_range:"));
        REQUIRE(has("name: must not be empty"));
        REQUIRE(has("timbre.warmth:"));
    }

    SECTION("text fields must be UTF-8") {
        auto profile = validProfile();
        profile.name = "Caf\xe9";
        profile.accent = "\xff";
        profile.timbre["\xc3"] = 0.5f;

        auto report = profile.validate();
        REQUIRE(report.errors == std::vector<std::string>{
            "name: must be valid UTF-8",
            "accent: must be valid UTF-8",
            "timbre: quality names must be valid UTF-8",
        });
    }
}

TEST_CASE("ProfileOverrides apply only the fields they carry", "[profile][overrides]") {
    auto base = validProfile();
    auto profile = base;

    auto overrides = ProfileOverrides().withPitch(-1.0f).withEmotion("happy");
    overrides.applyTo(profile);

    REQUIRE(profile.pitch == -1.0f);
    REQUIRE(profile.emotion_default == "happy");

    profile.pitch = base.pitch;
    profile.emotion_default = base.emotion_default;
    REQUIRE(profile == base);

    REQUIRE(overrides.keys() == std::vector<std::string>{"pitch", "emotion_default"});
    REQUIRE(ProfileOverrides().empty());
}

TEST_CASE("ProfileOverrides::fromJson parses and rejects fields", "[profile][overrides]") {
    ProfileOverrides overrides;

    SECTION("known fields") {
        auto json = nlohmann::json::parse(R"({
            "pitch": 2, "gender": "male", "timbre": {"warmth": 0.4},
            "custom_params": {"engine_voice": "v2"}
        })");
        REQUIRE(ProfileOverrides::fromJson(json, overrides).isOk());
        REQUIRE(overrides.pitch.value() == 2.0f);
        REQUIRE(overrides.gender.value() == "male");
        REQUIRE(overrides.timbre->at("warmth") == Approx(0.4f));
        REQUIRE(overrides.custom_params->at("engine_voice") == "v2");
    }

    SECTION("identity fields cannot be overridden") {
        auto err = ProfileOverrides::fromJson({{"name", "x"}, {"profile_id", "y"}}, overrides);
        REQUIRE(err.code == ErrorCode::INVALID_ARGUMENT);
        REQUIRE(err.errors.size() == 2);
    }

    SECTION("unknown and mistyped fields") {
        auto err = ProfileOverrides::fromJson({{"colour", "red"}, {"speed", "fast"}}, overrides);
        REQUIRE(err.code == ErrorCode::INVALID_ARGUMENT);
        REQUIRE(err.errors.size() == 2);
    }

    SECTION("non-object input") {
        auto err = ProfileOverrides::fromJson(nlohmann::json::array(), overrides);
        REQUIRE(err.code == ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_CASE("Profile JSON round trip preserves every field", "[profile][json]") {
    auto profile = validProfile();
    auto json = profileToJson(profile);

    REQUIRE(json["profile_id"] == "abc-123");
    REQUIRE(json["custom_params"]["tremolo"].get<double>() == Approx(0.3));

    VoiceProfile loaded;
    REQUIRE(profileFromJson(json, loaded).isOk());
    REQUIRE(loaded == profile);

    SECTION("reparsed from text") {
        VoiceProfile reparsed;
        REQUIRE(profileFromJson(nlohmann::json::parse(json.dump(2)), reparsed).isOk());
        REQUIRE(reparsed == profile);
    }
}

TEST_CASE("profileFromJson rejects broken records", "[profile][json]") {
    VoiceProfile out;

    SECTION("missing profile_id") {
        auto err = profileFromJson({{"name", "x"}}, out);
        REQUIRE(err.code == ErrorCode::FORMAT_ERROR);
    }

    SECTION("wrong field type") {
        auto err = profileFromJson({{"profile_id", "a"}, {"pitch", "high"}}, out);
        REQUIRE(err.code == ErrorCode::FORMAT_ERROR);
    }

    SECTION("not an object") {
        REQUIRE(profileFromJson("text", out).code == ErrorCode::FORMAT_ERROR);
    }
}

TEST_CASE("generateProfileId produces unique UUID v4 strings", "[profile][id]") {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto id = generateProfileId();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[14] == '4');
        REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 200);
}

TEST_CASE("currentTimestamp is ISO-8601 with microseconds", "[profile][id]") {
    auto ts = currentTimestamp();
    REQUIRE(ts.size() == 26);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts[19] == '.');
}
