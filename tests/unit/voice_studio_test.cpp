// =============================================================================
// VoiceStudio Tests
// =============================================================================
// 对外接口: 档案管理、合成、文件处理、变声、导出
// =============================================================================

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/audio/pcm_codec.hpp"
#include "test_helpers/test_audio.h"
#include "voice_api.hpp"

namespace fs = std::filesystem;

namespace {

Vox::VoiceConfig testConfig(const vox_test::TempDir& dir) {
    return Vox::VoiceConfig::InMemory()
        .withSampleRate(16000)
        .withOutputDir((dir.path() / "exports").string());
}

std::string createVoice(Vox::VoiceStudio& studio, const std::string& preset = "professional_male") {
    Vox::VoiceInfo info;
    auto status = studio.CreateVoice("Test Voice", preset, Vox::VoiceOverrides(), info);
    REQUIRE(status.IsSuccess());
    return info.profile_id;
}

}  // namespace

TEST_CASE("VoiceStudio initializes the tone engine", "[api][init]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));

    REQUIRE(studio.IsInitialized());
    REQUIRE(studio.GetEngineName() == "tone");
    REQUIRE(studio.GetConfig().sample_rate == 16000);

    REQUIRE(studio.ListPresets().size() == 6);
    REQUIRE(studio.ListEmotions().size() == 8);
    REQUIRE(studio.ListEffects().size() == 9);
    REQUIRE(studio.ListEffects().front() == "reverb");
    REQUIRE(studio.ListTransforms() ==
        std::vector<std::string>{"male_to_female", "female_to_male", "robot"});
    REQUIRE(Vox::VoiceStudio::ListEngines() == std::vector<std::string>{"tone", "http"});
}

TEST_CASE("VoiceStudio voice management", "[api][voices]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));

    Vox::VoiceInfo info;
    auto status = studio.CreateVoice("Announcer", "professional_male",
        Vox::VoiceOverrides().withPitch(-1.0f).withTimbre({{"warmth", 0.8f}}), info);
    REQUIRE(status.IsSuccess());
    REQUIRE(status.code == "OK");
    REQUIRE(info.name == "Announcer");
    REQUIRE(info.pitch == -1.0f);
    REQUIRE(info.speed == 0.95f);
    REQUIRE(info.gender == "male");
    REQUIRE(info.timbre.at("warmth") == 0.8f);
    REQUIRE(info.custom_params == "{}");

    SECTION("invalid voice is rejected and not stored") {
        Vox::VoiceInfo bad;
        auto err = studio.CreateVoice("Squeaky", "professional_male",
            Vox::VoiceOverrides().withPitch(15.0f), bad);
        REQUIRE_FALSE(err.IsSuccess());
        REQUIRE(err.code == "VALIDATION_FAILED");
        REQUIRE(err.errors.size() == 1);

        std::vector<Vox::VoiceInfo> voices;
        REQUIRE(studio.ListVoices(voices).IsSuccess());
        REQUIRE(voices.size() == 1);
    }

    SECTION("unknown preset") {
        Vox::VoiceInfo bad;
        auto status = studio.CreateVoice("X", "pirate", Vox::VoiceOverrides(), bad);
        REQUIRE(status.code == "UNKNOWN_PRESET");
        REQUIRE(status.field == "base_preset");
    }

    SECTION("custom params") {
        Vox::VoiceInfo styled;
        REQUIRE(studio.CreateVoice("Newsreader", "professional_male",
            Vox::VoiceOverrides().withCustomParams(R"({"style":"news"})"), styled).IsSuccess());
        REQUIRE(styled.custom_params == R"({"style":"news"})");

        Vox::VoiceInfo bad;
        auto status = studio.CreateVoice("Broken", "professional_male",
            Vox::VoiceOverrides().withCustomParams("[1]"), bad);
        REQUIRE(status.code == "INVALID_ARGUMENT");
        REQUIRE(status.field == "custom_params");

        status = studio.UpdateVoice(info.profile_id,
            Vox::VoiceOverrides().withCustomParams("{not json"), bad);
        REQUIRE(status.code == "INVALID_ARGUMENT");
        REQUIRE(status.field == "custom_params");

        std::vector<Vox::VoiceInfo> voices;
        REQUIRE(studio.ListVoices(voices).IsSuccess());
        REQUIRE(voices.size() == 2);
    }

    SECTION("name that is not UTF-8") {
        Vox::VoiceInfo bad;
        auto status = studio.CreateVoice("Caf\xe9", "professional_male", Vox::VoiceOverrides(), bad);
        REQUIRE(status.code == "VALIDATION_FAILED");
        REQUIRE(status.errors == std::vector<std::string>{"name: must be valid UTF-8"});
    }

    SECTION("update, get and delete") {
        Vox::VoiceInfo updated;
        REQUIRE(studio.UpdateVoice(info.profile_id, Vox::VoiceOverrides().withEmotion("calm"),
            updated).IsSuccess());
        REQUIRE(updated.emotion_default == "calm");
        REQUIRE(updated.pitch == -1.0f);

        Vox::VoiceInfo loaded;
        REQUIRE(studio.GetVoice(info.profile_id, loaded).IsSuccess());
        REQUIRE(loaded.emotion_default == "calm");

        REQUIRE(studio.DeleteVoice(info.profile_id));
        REQUIRE_FALSE(studio.DeleteVoice(info.profile_id));
        REQUIRE(studio.GetVoice(info.profile_id, loaded).code == "NOT_FOUND");
    }
}

TEST_CASE("VoiceStudio::ParseOverrides reads JSON overrides", "[api][voices]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));

    SECTION("valid overrides feed CreateVoice") {
        Vox::VoiceOverrides overrides;
        auto status = Vox::VoiceStudio::ParseOverrides(
            R"({"pitch":-1,"timbre":{"warmth":0.6},"custom_params":{"style":"news"}})", overrides);
        REQUIRE(status.IsSuccess());
        REQUIRE(overrides.pitch == -1.0f);
        REQUIRE(overrides.custom_params == std::string(R"({"style":"news"})"));

        Vox::VoiceInfo info;
        REQUIRE(studio.CreateVoice("Anchor", "professional_male", overrides, info).IsSuccess());
        REQUIRE(info.pitch == -1.0f);
        REQUIRE(info.timbre.at("warmth") == 0.6f);
        REQUIRE(info.custom_params.find("news") != std::string::npos);
    }

    SECTION("rejected fields are collected") {
        Vox::VoiceOverrides overrides = Vox::VoiceOverrides().withPitch(2.0f);
        auto status = Vox::VoiceStudio::ParseOverrides(R"({"name":"x","bogus":1})", overrides);
        REQUIRE(status.code == "INVALID_ARGUMENT");
        REQUIRE(status.errors.size() == 2);
        REQUIRE(overrides.pitch == 2.0f);
    }

    SECTION("text that is not JSON") {
        Vox::VoiceOverrides overrides;
        REQUIRE(Vox::VoiceStudio::ParseOverrides("not json", overrides).code == "INVALID_ARGUMENT");
        REQUIRE(Vox::VoiceStudio::ParseOverrides("[1, 2]", overrides).code == "INVALID_ARGUMENT");
    }
}

TEST_CASE("VoiceStudio::Speak synthesizes and shapes audio", "[api][speak]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));
    auto id = createVoice(studio);

    SECTION("profile prosody is applied after synthesis") {
        auto result = studio.Speak("Hello world", id);
        REQUIRE(result->IsSuccess());
        REQUIRE(result->GetFormat() == "pcm_s16le");
        REQUIRE(result->GetSampleRate() == 16000);
        REQUIRE(result->GetDurationMs() > 0);
        REQUIRE_FALSE(result->GetAudioData().empty());

        auto history = result->GetHistory();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0] == "synthesize(engine=tone,voice=default)");
        REQUIRE(history[1] == "prosody(pitch=-2.00,speed=0.95,volume=1.00)");
    }

    SECTION("emotion and effects") {
        Vox::SpeakOptions options;
        options.emotion = "happy";
        options.emotion_intensity = 0.5f;
        options.effects = {"eq:bass=2", "reverb:room_size=0.3"};

        auto result = studio.Speak("Good news", id, options);
        REQUIRE(result->IsSuccess());
        auto history = result->GetHistory();
        REQUIRE(history.size() == 4);
        REQUIRE(history[1].rfind("prosody(pitch=-1.00,speed=1.00,", 0) == 0);
        REQUIRE(history[2] == "equalizer(bass=2.00,mid=0.00,treble=0.00)");
        REQUIRE(history[3] == "reverb(room_size=0.30,damping=0.50)");
    }

    SECTION("bad effect descriptor reports its position") {
        Vox::SpeakOptions options;
        options.effects = {"reverb", "echo:feedback=1.5"};
        auto result = studio.Speak("Hello", id, options);
        REQUIRE_FALSE(result->IsSuccess());
        REQUIRE(result->GetCode() == "PARAMETER_RANGE");
        REQUIRE(result->GetEffectPosition() == 2);
        REQUIRE(result->GetEffectKind() == "echo");
        REQUIRE(result->GetAudioData().empty());

        options.effects = {"echo:bogus=1"};
        result = studio.Speak("Hello", id, options);
        REQUIRE(result->GetCode() == "INVALID_ARGUMENT");
        REQUIRE(result->GetField() == "bogus");
        REQUIRE(result->GetEffectPosition() == 1);
    }

    SECTION("out-of-range time stretch fails the chain") {
        Vox::SpeakOptions options;
        options.effects = {"reverb", "time_stretch:factor=0.001"};
        auto result = studio.Speak("Hello", id, options);
        REQUIRE(result->GetCode() == "PARAMETER_RANGE");
        REQUIRE(result->GetEffectPosition() == 2);
        REQUIRE(result->GetEffectKind() == "time_stretch");
    }

    SECTION("input errors") {
        REQUIRE(studio.Speak("   ", id)->GetCode() == "INVALID_TEXT");
        REQUIRE(studio.Speak(std::string(5001, 'x'), id)->GetCode() == "TEXT_TOO_LONG");
        REQUIRE(studio.Speak("Hello", "no-such-voice")->GetCode() == "NOT_FOUND");

        Vox::SpeakOptions options;
        options.emotion = "bored";
        REQUIRE(studio.Speak("Hello", id, options)->GetCode() == "UNKNOWN_EMOTION");

        options.emotion = "happy";
        options.emotion_intensity = 2.0f;
        REQUIRE(studio.Speak("Hello", id, options)->GetCode() == "VALIDATION_FAILED");
    }
}

TEST_CASE("VoiceStudio works on audio files", "[api][files]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));
    auto id = createVoice(studio, "child_voice");

    auto input = dir.path() / "input.wav";
    vox_test::writeBytes(input, vox_test::sineAudio(220.0f, 0.5, voice::kFormatWav).bytes);

    SECTION("Process applies a saved voice") {
        Vox::SpeakOptions options;
        options.effects = {"compressor:ratio=2"};
        auto result = studio.Process(input.string(), id, options);
        REQUIRE(result->IsSuccess());
        REQUIRE(result->GetFormat() == "wav");
        REQUIRE(result->GetHistory().size() == 2);
    }

    SECTION("Process with a missing file") {
        auto result = studio.Process((dir.path() / "missing.wav").string(), id);
        REQUIRE(result->GetCode() == "NOT_FOUND");
    }

    SECTION("Transform with a preset") {
        auto result = studio.Transform(input.string(), "female_to_male");
        REQUIRE(result->IsSuccess());
        REQUIRE(result->GetHistory().size() == 1);
        REQUIRE(result->GetHistory()[0].rfind("voice_transform(pitch_shift=-4.00", 0) == 0);

        REQUIRE(studio.Transform(input.string(), "chipmunk")->GetCode() == "UNKNOWN_PRESET");
    }

    SECTION("Transcribe is unsupported by the tone engine") {
        auto result = studio.Transcribe(input.string());
        REQUIRE(result->GetCode() == "BACKEND_ERROR");
        REQUIRE(result->GetText().empty());
    }
}

TEST_CASE("VoiceStudio exports inside the output directory", "[api][export]") {
    vox_test::TempDir dir("vox_api");
    Vox::VoiceStudio studio(testConfig(dir));
    auto id = createVoice(studio);
    auto result = studio.Speak("Export me", id);
    REQUIRE(result->IsSuccess());

    std::string written;

    SECTION("relative path") {
        auto status = studio.Export(*result, "clips/hello.wav", false, written);
        REQUIRE(status.IsSuccess());
        REQUIRE(fs::exists(written));
        REQUIRE(fs::file_size(written) == result->GetAudioData().size() + 44);

        REQUIRE(studio.Export(*result, "clips/hello.wav", false, written).code == "ALREADY_EXISTS");
        REQUIRE(studio.Export(*result, "clips/hello.wav", true, written).IsSuccess());
    }

    SECTION("escaping the output directory") {
        auto status = studio.Export(*result, "../escape.wav", false, written);
        REQUIRE(status.code == "SECURITY_VIOLATION");
        REQUIRE_FALSE(fs::exists(dir.path() / "escape.wav"));
    }

    SECTION("failed results cannot be exported") {
        auto failed = studio.Speak("", id);
        REQUIRE(studio.Export(*failed, "empty.wav", false, written).code == "INVALID_ARGUMENT");
    }

    SECTION("SaveToFile wraps pcm in WAV") {
        auto path = (dir.path() / "direct.wav").string();
        REQUIRE(result->SaveToFile(path));
        REQUIRE(fs::file_size(path) == result->GetAudioData().size() + 44);
    }
}

TEST_CASE("VoiceStudio without a working backend still manages voices", "[api][init]") {
    vox_test::TempDir dir("vox_api");

    SECTION("http without endpoint") {
        Vox::VoiceStudio studio(testConfig(dir).withEngine("http"));
        REQUIRE_FALSE(studio.IsInitialized());

        auto id = createVoice(studio);
        auto result = studio.Speak("Hello", id);
        REQUIRE(result->GetCode() == "NOT_INITIALIZED");
    }

    SECTION("unknown engine") {
        Vox::VoiceStudio studio(testConfig(dir).withEngine("festival"));
        REQUIRE_FALSE(studio.IsInitialized());
        REQUIRE(studio.GetEngineName() == "Unknown");
        REQUIRE(studio.Speak("Hello", createVoice(studio))->GetCode() == "NOT_INITIALIZED");
    }
}

TEST_CASE("VoiceStudio persists voices on disk", "[api][storage]") {
    vox_test::TempDir dir("vox_api");
    auto config = testConfig(dir).withStoragePath((dir.path() / "profiles").string());

    std::string id;
    {
        Vox::VoiceStudio studio(config);
        id = createVoice(studio, "narrator_deep");
    }

    Vox::VoiceStudio reopened(config);
    Vox::VoiceInfo info;
    REQUIRE(reopened.GetVoice(id, info).IsSuccess());
    REQUIRE(info.pitch == -4.0f);

    std::vector<Vox::VoiceInfo> voices;
    REQUIRE(reopened.ListVoices(voices).IsSuccess());
    REQUIRE(voices.size() == 1);
    REQUIRE(voices[0].profile_id == id);
}
