#include "internal/effects/effect_processor.hpp"

#include <cmath>

#include <algorithm>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/audio/pcm_codec.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace voice {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

// Schroeder 梳状滤波器延迟 (ms), 互质以避免共振叠加
constexpr float kCombDelaysMs[] = {29.7f, 37.1f, 41.1f, 43.7f};
constexpr float kReverbWet = 0.35f;

// 毫秒换算为采样数, 在 double 下截断到 [1, max(limit, 1)] 后再转换
size_t delaySamples(double delay_ms, int sr, size_t limit) {
    double samples = delay_ms * sr / 1000.0;
    double upper = static_cast<double>(std::max<size_t>(limit, 1));
    if (!(samples >= 1.0)) return 1;
    if (samples >= upper) return static_cast<size_t>(upper);
    return static_cast<size_t>(samples);
}

std::vector<float> renderReverb(const std::vector<float>& x, const ReverbParams& p, int sr) {
    if (x.empty()) return x;

    float feedback = 0.70f + 0.28f * p.room_size;
    std::vector<float> wet(x.size(), 0.0f);

    for (float delay_ms : kCombDelaysMs) {
        size_t delay = delaySamples(delay_ms, sr, x.size());
        std::vector<float> buffer(delay, 0.0f);
        size_t idx = 0;
        float filter_state = 0.0f;

        for (size_t n = 0; n < x.size(); ++n) {
            float out = buffer[idx];
            // 反馈路径上的一阶低通即阻尼
            filter_state = out * (1.0f - p.damping) + filter_state * p.damping;
            buffer[idx] = x[n] + filter_state * feedback;
            idx = (idx + 1) % delay;
            wet[n] += out * 0.25f;
        }
    }

    std::vector<float> y(x.size());
    for (size_t n = 0; n < x.size(); ++n) {
        y[n] = x[n] * (1.0f - kReverbWet) + wet[n] * kReverbWet;
    }
    return y;
}

std::vector<float> renderEcho(const std::vector<float>& x, const EchoParams& p, int sr) {
    // 延迟超过音频长度时没有回声
    size_t delay = delaySamples(p.delay_ms, sr, x.size());
    std::vector<float> y = x;
    for (size_t n = delay; n < y.size(); ++n) {
        y[n] += p.feedback * y[n - delay];
    }
    return y;
}

std::vector<float> renderEqualizer(const std::vector<float>& x, const EqualizerParams& p, int sr) {
    // 三段分频: < 250Hz / 250Hz-4kHz / > 4kHz
    std::vector<float> low = audio::lowPass(x, 250.0f, sr);
    std::vector<float> below_high = audio::lowPass(x, 4000.0f, sr);

    float g_bass = audio::dbToLinear(p.bass);
    float g_mid = audio::dbToLinear(p.mid);
    float g_treble = audio::dbToLinear(p.treble);

    std::vector<float> y(x.size());
    for (size_t n = 0; n < x.size(); ++n) {
        float mid = below_high[n] - low[n];
        float high = x[n] - below_high[n];
        y[n] = low[n] * g_bass + mid * g_mid + high * g_treble;
    }
    return y;
}

std::vector<float> renderChorus(const std::vector<float>& x, const ChorusParams& p, int sr) {
    if (p.depth <= 0.0f) return x;

    double base = 0.020 * sr;                // 20ms
    double sweep = 0.005 * sr * p.depth;     // 最大 +/-5ms
    std::vector<float> y(x.size());

    for (size_t n = 0; n < x.size(); ++n) {
        double lfo = std::sin(2.0 * M_PI * p.rate * static_cast<double>(n) / sr);
        double pos = static_cast<double>(n) - (base + sweep * lfo);
        float delayed = 0.0f;
        if (pos >= 0.0 && pos < static_cast<double>(x.size())) {
            size_t i = static_cast<size_t>(pos);
            float frac = static_cast<float>(pos - static_cast<double>(i));
            float a = x[i];
            float b = (i + 1 < x.size()) ? x[i + 1] : a;
            delayed = a + (b - a) * frac;
        }
        y[n] = 0.6f * x[n] + 0.4f * p.depth * delayed;
    }
    return y;
}

std::vector<float> renderNoiseGate(const std::vector<float>& x, const NoiseGateParams& p, int sr) {
    size_t block = std::max<size_t>(1, static_cast<size_t>(sr / 100));  // 10ms
    float threshold = audio::dbToLinear(p.threshold_db);
    std::vector<float> y = x;

    for (size_t start = 0; start < y.size(); start += block) {
        size_t end = std::min(start + block, y.size());
        std::vector<float> frame(y.begin() + start, y.begin() + end);
        if (audio::calculateRMS(frame) < threshold) {
            std::fill(y.begin() + start, y.begin() + end, 0.0f);
        }
    }
    return y;
}

std::vector<float> renderDistortion(const std::vector<float>& x, const DistortionParams& p) {
    if (p.amount <= 0.0f) return x;

    float drive = 1.0f + p.amount * 20.0f;
    float norm = std::tanh(drive);
    std::vector<float> y(x.size());
    for (size_t n = 0; n < x.size(); ++n) {
        y[n] = std::tanh(drive * x[n]) / norm;
    }
    return y;
}

}  // namespace

// =============================================================================
// 渲染
// =============================================================================

std::vector<float> PcmEffectProcessor::render(const std::vector<float>& samples,
    const EffectConfig& effect,
    int sample_rate) {
    return std::visit([&](const auto& p) -> std::vector<float> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReverbParams>) {
            return renderReverb(samples, p, sample_rate);
        } else if constexpr (std::is_same_v<T, EchoParams>) {
            return renderEcho(samples, p, sample_rate);
        } else if constexpr (std::is_same_v<T, EqualizerParams>) {
            return renderEqualizer(samples, p, sample_rate);
        } else if constexpr (std::is_same_v<T, ChorusParams>) {
            return renderChorus(samples, p, sample_rate);
        } else if constexpr (std::is_same_v<T, CompressorParams>) {
            return audio::applyCompression(samples, audio::dbToLinear(p.threshold_db), p.ratio);
        } else if constexpr (std::is_same_v<T, DistortionParams>) {
            return renderDistortion(samples, p);
        } else if constexpr (std::is_same_v<T, NoiseGateParams>) {
            return renderNoiseGate(samples, p, sample_rate);
        } else if constexpr (std::is_same_v<T, PitchShiftParams>) {
            return audio::pitchShift(samples, p.semitones, sample_rate);
        } else if constexpr (std::is_same_v<T, TimeStretchParams>) {
            return audio::timeStretch(samples, p.factor, sample_rate);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled effect type");
        }
    }, effect);
}

ErrorInfo PcmEffectProcessor::process(const AudioData& input,
    const EffectConfig& effect,
    AudioData& output) {
    std::vector<float> samples;
    int sample_rate = 0;
    auto err = audio::decodeAudio(input, samples, sample_rate);
    if (!err.isOk()) {
        std::cerr << "[PcmEffectProcessor] " << err.message << std::endl;
        return err;
    }

    std::vector<float> rendered = render(samples, effect, sample_rate);

    AudioData result;
    err = audio::encodeSamples(rendered, sample_rate, input.format, result);
    if (!err.isOk()) {
        return err;
    }
    result.processing_history = input.processing_history;
    output = std::move(result);
    return ErrorInfo::ok();
}

}  // namespace voice
