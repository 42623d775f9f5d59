#include "internal/backends/tone/tone_synth_backend.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "internal/audio/pcm_codec.hpp"
#include "internal/text/text_normalizer.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace voice {

namespace {

constexpr float kSegmentSeconds = 0.08f;     // 每个字符的基础时长
constexpr float kPauseSeconds = 0.06f;       // 空白 / 标点的停顿
constexpr float kFadeSeconds = 0.008f;       // 段首尾淡入淡出, 避免爆音
constexpr float kBaseFrequency = 140.0f;
constexpr float kAmplitude = 0.3f;

uint32_t charCode(const std::string& ch) {
    uint32_t code = 0;
    for (unsigned char c : ch) {
        code = code * 31u + c;
    }
    return code;
}

void appendTone(std::vector<float>& out, uint32_t code, size_t length, int sample_rate) {
    // 基频在 140Hz 附近按字符变化, 第二、三谐波模拟元音共振
    float f0 = kBaseFrequency * (1.0f + static_cast<float>(code % 12) / 24.0f);
    float h2 = 0.5f + static_cast<float>((code / 12) % 5) * 0.1f;
    float h3 = 0.2f + static_cast<float>((code / 60) % 4) * 0.05f;
    size_t fade = std::min(length / 2, static_cast<size_t>(kFadeSeconds * sample_rate));

    for (size_t n = 0; n < length; ++n) {
        float t = static_cast<float>(n) / sample_rate;
        float w = 2.0f * static_cast<float>(M_PI) * f0 * t;
        float sample = std::sin(w) + h2 * std::sin(2.0f * w) + h3 * std::sin(3.0f * w);
        sample *= kAmplitude / (1.0f + h2 + h3);

        float env = 1.0f;
        if (fade > 0 && n < fade) env = static_cast<float>(n) / fade;
        if (fade > 0 && n + fade > length) env = static_cast<float>(length - n) / fade;
        out.push_back(sample * env);
    }
}

}  // namespace

ToneSynthBackend::~ToneSynthBackend() {
    shutdown();
}

ErrorInfo ToneSynthBackend::initialize(const EngineConfig& config) {
    if (config.sample_rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Invalid sample rate");
    }
    sample_rate_ = config.sample_rate;
    initialized_ = true;
    std::cout << "[ToneSynthBackend] Initialized (sample_rate=" << sample_rate_ << ")" << std::endl;
    return ErrorInfo::ok();
}

void ToneSynthBackend::shutdown() {
    initialized_ = false;
}

ErrorInfo ToneSynthBackend::synthesize(const SynthesisRequest& request, AudioData& out) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }
    auto err = checkText(request.text);
    if (!err.isOk()) {
        std::cerr << "[ToneSynthBackend] " << err.message << std::endl;
        return err;
    }
    if (!(request.speed > 0.0f)) {
        return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, "speed", "speed must be greater than 0");
    }

    size_t segment = std::max<size_t>(1,
        static_cast<size_t>(kSegmentSeconds * sample_rate_ / request.speed));
    size_t pause = std::max<size_t>(1,
        static_cast<size_t>(kPauseSeconds * sample_rate_ / request.speed));

    std::vector<float> samples;
    for (const auto& ch : text::splitUtf8(request.text)) {
        bool is_space = ch.length() == 1 && std::isspace(static_cast<unsigned char>(ch[0]));
        if (is_space || text::isPunctuation(ch)) {
            samples.insert(samples.end(), pause, 0.0f);
        } else {
            appendTone(samples, charCode(ch), segment, sample_rate_);
        }
    }

    AudioData result;
    err = audio::encodeSamples(samples, sample_rate_, kFormatPcmS16le, result);
    if (!err.isOk()) {
        return err;
    }
    result.processing_history.push_back("synthesize(engine=tone,voice=" + request.voice + ")");
    out = result;
    return ErrorInfo::ok();
}

}  // namespace voice
