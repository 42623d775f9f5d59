#include "internal/audio/audio_processor.hpp"

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <random>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace voice {
namespace audio {

// =============================================================================
// 电平
// =============================================================================

float calculateRMS(const std::vector<float>& audio) {
    if (audio.empty()) return 0.0f;

    float sum_squares = 0.0f;
    for (float sample : audio) {
        sum_squares += sample * sample;
    }
    return std::sqrt(sum_squares / audio.size());
}

float dbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

std::vector<float> applyGain(const std::vector<float>& audio, float gain) {
    std::vector<float> processed = audio;
    for (float& sample : processed) {
        sample *= gain;
    }
    return processed;
}

std::vector<float> applyCompression(const std::vector<float>& audio,
                                    float threshold,
                                    float ratio) {
    std::vector<float> compressed = audio;

    for (float& sample : compressed) {
        float abs_sample = std::abs(sample);
        if (abs_sample > threshold) {
            // Apply compression above threshold
            float over_threshold = abs_sample - threshold;
            float compressed_over = over_threshold / ratio;
            float new_abs = threshold + compressed_over;
            sample = (sample < 0) ? -new_abs : new_abs;
        }
    }

    return compressed;
}

// =============================================================================
// 重采样
// =============================================================================

std::vector<float> resampleByRatio(const std::vector<float>& audio, double ratio) {
    if (audio.empty() || !(ratio > 0.0) || ratio == 1.0) {
        return audio;
    }
    ratio = std::min(std::max(ratio, 1.0 / kMaxStretchRate), 1.0 / kMinStretchRate);

    size_t output_size = std::max<size_t>(1, static_cast<size_t>(std::lround(audio.size() * ratio)));
    std::vector<float> resampled(output_size);

    for (size_t i = 0; i < output_size; ++i) {
        double src_pos = i / ratio;
        size_t src_idx = static_cast<size_t>(src_pos);
        double frac = src_pos - src_idx;

        if (src_idx + 1 < audio.size()) {
            // Linear interpolation between two adjacent samples
            resampled[i] = static_cast<float>(
                audio[src_idx] * (1.0 - frac) + audio[src_idx + 1] * frac);
        } else if (src_idx < audio.size()) {
            resampled[i] = audio[src_idx];
        } else {
            resampled[i] = audio.back();
        }
    }

    return resampled;
}

std::vector<float> resampleAudio(const std::vector<float>& audio,
    int src_rate,
    int dst_rate) {
    if (audio.empty() || src_rate == dst_rate || src_rate <= 0 || dst_rate <= 0) {
        return audio;
    }
    return resampleByRatio(audio, static_cast<double>(dst_rate) / src_rate);
}

// =============================================================================
// 时间伸缩 / 变调
// =============================================================================

std::vector<float> timeStretch(const std::vector<float>& audio,
    double rate,
    int sample_rate) {
    if (audio.empty() || !(rate > 0.0) || rate == 1.0) {
        return audio;
    }
    rate = std::min(std::max(rate, kMinStretchRate), kMaxStretchRate);

    size_t output_size = std::max<size_t>(1, static_cast<size_t>(std::lround(audio.size() / rate)));

    // 30ms Hann 窗, 50% 重叠
    size_t frame = static_cast<size_t>(std::max(64, sample_rate * 3 / 100));
    if (frame >= audio.size()) {
        // 太短无法分帧, 退化为直接重采样
        return resampleByRatio(audio, static_cast<double>(output_size) / audio.size());
    }
    size_t hop = frame / 2;

    std::vector<float> window(frame);
    for (size_t k = 0; k < frame; ++k) {
        window[k] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * k / (frame - 1)));
    }

    std::vector<float> stretched(output_size + frame, 0.0f);
    std::vector<float> weight(output_size + frame, 0.0f);

    for (size_t out_pos = 0; out_pos < output_size; out_pos += hop) {
        size_t in_pos = static_cast<size_t>(out_pos * rate);
        for (size_t k = 0; k < frame; ++k) {
            float sample = (in_pos + k < audio.size()) ? audio[in_pos + k] : 0.0f;
            stretched[out_pos + k] += sample * window[k];
            weight[out_pos + k] += window[k];
        }
    }

    for (size_t i = 0; i < stretched.size(); ++i) {
        if (weight[i] > 1e-3f) {
            stretched[i] /= weight[i];
        }
    }

    stretched.resize(output_size);
    return stretched;
}

std::vector<float> pitchShift(const std::vector<float>& audio,
    float semitones,
    int sample_rate) {
    if (audio.empty() || semitones == 0.0f) {
        return audio;
    }

    double factor = std::pow(2.0, semitones / 12.0);

    // 先伸长 factor 倍, 再以 1/factor 重采样回原长度, 音高整体乘以 factor
    std::vector<float> stretched = timeStretch(audio, 1.0 / factor, sample_rate);
    std::vector<float> shifted = resampleByRatio(stretched,
        static_cast<double>(audio.size()) / stretched.size());
    shifted.resize(audio.size(), 0.0f);
    return shifted;
}

// =============================================================================
// 滤波 / 音色
// =============================================================================

std::vector<float> lowPass(const std::vector<float>& audio,
    float cutoff_hz,
    int sample_rate) {
    if (audio.empty() || sample_rate <= 0) return audio;

    float dt = 1.0f / sample_rate;
    float rc = 1.0f / (2.0f * static_cast<float>(M_PI) * cutoff_hz);
    float alpha = dt / (rc + dt);

    std::vector<float> filtered(audio.size());
    float prev = 0.0f;
    for (size_t i = 0; i < audio.size(); ++i) {
        prev = prev + alpha * (audio[i] - prev);
        filtered[i] = prev;
    }
    return filtered;
}

std::vector<float> spectralTilt(const std::vector<float>& audio,
    float amount,
    int sample_rate) {
    if (audio.empty() || amount == 0.0f) return audio;

    std::vector<float> low = lowPass(audio, 1500.0f, sample_rate);
    std::vector<float> tilted(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        float high = audio[i] - low[i];
        // amount > 0: 提升高频; amount < 0: 衰减高频
        tilted[i] = low[i] + high * (1.0f + amount);
    }
    return tilted;
}

std::vector<float> addEnvelopeNoise(const std::vector<float>& audio,
    float level,
    uint32_t seed) {
    if (audio.empty() || level <= 0.0f) return audio;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    std::vector<float> noisy(audio.size());
    float envelope = 0.0f;
    for (size_t i = 0; i < audio.size(); ++i) {
        envelope = 0.995f * envelope + 0.005f * std::abs(audio[i]);
        noisy[i] = audio[i] * (1.0f - 0.5f * level) + dist(rng) * envelope * level * 2.0f;
    }
    return noisy;
}

std::vector<float> amplitudeModulate(const std::vector<float>& audio,
    float depth,
    float rate_hz,
    int sample_rate) {
    if (audio.empty() || depth <= 0.0f || sample_rate <= 0) return audio;

    std::vector<float> modulated(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        float phase = 2.0f * static_cast<float>(M_PI) * rate_hz * i / sample_rate;
        float gain = 1.0f - depth * 0.5f * (1.0f + std::sin(phase));
        modulated[i] = audio[i] * gain;
    }
    return modulated;
}

// =============================================================================
// 格式转换
// =============================================================================

std::vector<int16_t> floatToInt16(const std::vector<float>& audio) {
    std::vector<int16_t> result(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        float sample = audio[i];
        // Clamp to [-1.0, 1.0]
        if (sample > 1.0f) sample = 1.0f;
        if (sample < -1.0f) sample = -1.0f;
        result[i] = static_cast<int16_t>(sample * 32767.0f);
    }
    return result;
}

std::vector<float> int16ToFloat(const std::vector<int16_t>& audio) {
    std::vector<float> result(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        result[i] = static_cast<float>(audio[i]) / 32768.0f;
    }
    return result;
}

}  // namespace audio
}  // namespace voice
