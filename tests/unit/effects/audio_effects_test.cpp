// =============================================================================
// AudioEffects Chain Tests
// =============================================================================
// 效果链按顺序应用, 出错时报告位置并保持输出不变
// =============================================================================

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/effects/audio_effects.hpp"
#include "test_helpers/test_audio.h"

using namespace voice;

namespace {

// 在第 fail_at 次调用时返回错误, 其余调用原样透传
class ScriptedProcessor : public IEffectProcessor {
public:
    explicit ScriptedProcessor(int fail_at) : fail_at_(fail_at) {}

    std::string getName() const override { return "ScriptedProcessor"; }

    ErrorInfo process(const AudioData& input, const EffectConfig& effect, AudioData& output) override {
        ++calls;
        kinds.push_back(effectKindToString(effectKindOf(effect)));
        if (calls == fail_at_) {
            return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "processor exploded", "buffer underrun");
        }
        output = input;
        output.bytes.push_back(static_cast<uint8_t>(calls));
        return ErrorInfo::ok();
    }

    int calls = 0;
    std::vector<std::string> kinds;

private:
    int fail_at_;
};

}  // namespace

TEST_CASE("Empty chain returns the input unchanged", "[effects][chain]") {
    AudioEffects effects;
    auto input = vox_test::sineAudio();
    input.processing_history = {"synthesize(engine=tone,voice=default)"};

    AudioData out;
    REQUIRE(effects.applyEffects(input, {}, out).isOk());
    REQUIRE(out == input);
}

TEST_CASE("Chain records each effect in order", "[effects][chain]") {
    AudioEffects effects;
    auto input = vox_test::sineAudio();

    std::vector<EffectConfig> chain = {EqualizerParams{3.0f, 0.0f, 0.0f}, ReverbParams{}};
    AudioData out;
    REQUIRE(effects.applyEffects(input, chain, out).isOk());
    REQUIRE(out.processing_history == std::vector<std::string>{
        "equalizer(bass=3.00,mid=0.00,treble=0.00)",
        "reverb(room_size=0.50,damping=0.50)"});
    REQUIRE(out.format == input.format);
    REQUIRE(out.sample_rate == input.sample_rate);
    REQUIRE(input.processing_history.empty());
}

TEST_CASE("Effect order changes the result", "[effects][chain]") {
    AudioEffects effects;
    // 低频 + 大幅提升: 先均衡会在量化时削顶, 先混响则不会
    auto input = vox_test::sineAudio(100.0f, 0.5);

    std::vector<EffectConfig> eq_first = {EqualizerParams{12.0f, 0.0f, 0.0f}, ReverbParams{}};
    std::vector<EffectConfig> reverb_first = {ReverbParams{}, EqualizerParams{12.0f, 0.0f, 0.0f}};

    AudioData a;
    AudioData b;
    REQUIRE(effects.applyEffects(input, eq_first, a).isOk());
    REQUIRE(effects.applyEffects(input, reverb_first, b).isOk());

    REQUIRE(a.bytes != b.bytes);
    REQUIRE(a.processing_history != b.processing_history);
    REQUIRE(a.processing_history.front().rfind("equalizer", 0) == 0);
    REQUIRE(b.processing_history.front().rfind("reverb", 0) == 0);
}

TEST_CASE("Processor failure reports position and kind", "[effects][chain]") {
    auto processor = std::make_shared<ScriptedProcessor>(3);
    AudioEffects effects(processor);
    auto input = vox_test::sineAudio();

    std::vector<EffectConfig> chain = {
        ReverbParams{}, EchoParams{}, DistortionParams{0.3f}, ChorusParams{}};

    AudioData out;
    out.format = "sentinel";
    auto err = effects.applyEffects(input, chain, out);

    REQUIRE(err.code == ErrorCode::CHAIN_APPLICATION_FAILED);
    REQUIRE(err.effect_position == 3);
    REQUIRE(err.effect_kind == "distortion");
    REQUIRE(err.errors == std::vector<std::string>{"processor exploded"});
    REQUIRE(err.detail == "buffer underrun");
    REQUIRE(err.message.find("processor exploded") != std::string::npos);

    // 第 4 个效果不会被调用, 输出保持原样
    REQUIRE(processor->calls == 3);
    REQUIRE(processor->kinds == std::vector<std::string>{"reverb", "echo", "distortion"});
    REQUIRE(out.format == "sentinel");
    REQUIRE(out.bytes.empty());
}

TEST_CASE("Malformed descriptor fails before any processing", "[effects][chain]") {
    auto processor = std::make_shared<ScriptedProcessor>(0);
    AudioEffects effects(processor);
    auto input = vox_test::sineAudio();

    std::vector<EffectConfig> chain = {ReverbParams{}, ReverbParams{2.0f, 0.5f}, EchoParams{}};

    AudioData out;
    auto err = effects.applyEffects(input, chain, out);

    REQUIRE(err.code == ErrorCode::CHAIN_APPLICATION_FAILED);
    REQUIRE(err.effect_position == 2);
    REQUIRE(err.effect_kind == "reverb");
    REQUIRE(err.errors.size() == 1);
    REQUIRE(processor->calls == 0);
    REQUIRE(out.isEmpty());
}

TEST_CASE("Extreme time stretch factor is rejected before rendering", "[effects][chain]") {
    AudioEffects effects;
    auto input = vox_test::sineAudio();

    AudioData out;
    out.format = "sentinel";
    auto err = effects.applyEffects(input, {TimeStretchParams{1e-30f}}, out);

    REQUIRE(err.code == ErrorCode::CHAIN_APPLICATION_FAILED);
    REQUIRE(err.effect_position == 1);
    REQUIRE(err.effect_kind == "time_stretch");
    REQUIRE(out.format == "sentinel");
    REQUIRE(out.bytes.empty());
}

TEST_CASE("Echo longer than the audio leaves it unchanged", "[effects][chain]") {
    AudioEffects effects;
    auto input = vox_test::sineAudio(300.0f, 0.25);

    EffectConfig echo;
    REQUIRE(AudioEffects::createEcho(echo, 1e38f, 0.5f).isOk());

    AudioData out;
    REQUIRE(effects.applyEffects(input, {echo}, out).isOk());
    auto in_samples = vox_test::decode(input);
    auto out_samples = vox_test::decode(out);
    REQUIRE(out_samples.size() == in_samples.size());
    for (size_t i = 0; i < in_samples.size(); i += 97) {
        REQUIRE(out_samples[i] == Approx(in_samples[i]).margin(1e-3));
    }
    REQUIRE(out.processing_history.size() == input.processing_history.size() + 1);
}

TEST_CASE("Injected processor sees the previous stage output", "[effects][chain]") {
    auto processor = std::make_shared<ScriptedProcessor>(0);
    AudioEffects effects(processor);
    REQUIRE(effects.getProcessor()->getName() == "ScriptedProcessor");

    AudioData input;
    input.bytes = {9};
    input.sample_rate = 8000;

    AudioData out;
    REQUIRE(effects.applyEffects(input, {EchoParams{}, EchoParams{}}, out).isOk());
    REQUIRE(out.bytes == std::vector<uint8_t>{9, 1, 2});
    REQUIRE(out.processing_history.size() == 2);
}

TEST_CASE("Default processor falls back when null is injected", "[effects][chain]") {
    AudioEffects effects(nullptr);
    REQUIRE(effects.getProcessor()->getName() == "PcmEffectProcessor");
}
