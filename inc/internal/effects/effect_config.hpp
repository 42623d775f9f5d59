#ifndef EFFECT_CONFIG_HPP
#define EFFECT_CONFIG_HPP

#include <string>
#include <variant>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Effect Kind (效果类型)
// =============================================================================

enum class EffectKind {
    REVERB,
    ECHO,
    EQUALIZER,
    CHORUS,
    COMPRESSOR,
    DISTORTION,
    NOISE_GATE,
    PITCH_SHIFT,
    TIME_STRETCH,
};

inline const char* effectKindToString(EffectKind kind) {
    switch (kind) {
        case EffectKind::REVERB:       return "reverb";
        case EffectKind::ECHO:         return "echo";
        case EffectKind::EQUALIZER:    return "equalizer";
        case EffectKind::CHORUS:       return "chorus";
        case EffectKind::COMPRESSOR:   return "compressor";
        case EffectKind::DISTORTION:   return "distortion";
        case EffectKind::NOISE_GATE:   return "noise_gate";
        case EffectKind::PITCH_SHIFT:  return "pitch_shift";
        case EffectKind::TIME_STRETCH: return "time_stretch";
        default:                       return "unknown";
    }
}

// =============================================================================
// Effect Parameters (效果参数)
// =============================================================================

struct ReverbParams {
    float room_size = 0.5f;     ///< [0, 1]
    float damping = 0.5f;       ///< [0, 1]
};

struct EchoParams {
    float delay_ms = 500.0f;    ///< > 0
    float feedback = 0.3f;      ///< [0, 1)
};

struct EqualizerParams {
    float bass = 0.0f;          ///< [-12, +12] dB
    float mid = 0.0f;           ///< [-12, +12] dB
    float treble = 0.0f;        ///< [-12, +12] dB
};

struct ChorusParams {
    float depth = 0.5f;         ///< [0, 1]
    float rate = 1.5f;          ///< Hz, > 0
};

struct CompressorParams {
    float ratio = 4.0f;         ///< >= 1
    float threshold_db = -18.0f;  ///< <= 0
};

struct DistortionParams {
    float amount = 0.5f;        ///< [0, 1]
};

struct NoiseGateParams {
    float threshold_db = -50.0f;  ///< <= 0
};

struct PitchShiftParams {
    float semitones = 0.0f;     ///< |s| <= 24
};

struct TimeStretchParams {
    float factor = 1.0f;        ///< 播放速率 [0.01, 100], 输出时长 = 输入 / factor
};

// 闭合的效果集合, 运行时不会新增类型
using EffectConfig = std::variant<
    ReverbParams,
    EchoParams,
    EqualizerParams,
    ChorusParams,
    CompressorParams,
    DistortionParams,
    NoiseGateParams,
    PitchShiftParams,
    TimeStretchParams>;

/// @brief 效果类型
EffectKind effectKindOf(const EffectConfig& effect);

/// @brief 按名称解析效果类型
/// @return 名称未知时返回 false
bool parseEffectKind(const std::string& name, EffectKind& kind);

/// @brief 校验效果参数, 收集全部越界字段
ValidationReport validateEffect(const EffectConfig& effect);

/// @brief 效果描述, 形如 "reverb(room_size=0.50,damping=0.50)"
std::string describeEffect(const EffectConfig& effect);

}  // namespace voice

#endif  // EFFECT_CONFIG_HPP
