#include "internal/effects/effect_config.hpp"

#include <cmath>

#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/audio/audio_processor.hpp"

namespace voice {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

std::string fmt(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

void checkUnit(ValidationReport& report, const char* field, float value) {
    if (!(value >= 0.0f && value <= 1.0f)) {
        report.add(std::string(field) + ": must be between 0.0 and 1.0 (got " + fmt(value) + ")");
    }
}

void checkBandGain(ValidationReport& report, const char* field, float value) {
    if (!(value >= -12.0f && value <= 12.0f)) {
        report.add(std::string(field) + ": must be between -12.0 and +12.0 dB (got " + fmt(value) + ")");
    }
}

void checkPositive(ValidationReport& report, const char* field, float value) {
    if (!(value > 0.0f) || !std::isfinite(value)) {
        report.add(std::string(field) + ": must be greater than 0 (got " + fmt(value) + ")");
    }
}

void checkNonPositiveDb(ValidationReport& report, const char* field, float value) {
    if (!(value <= 0.0f) || !std::isfinite(value)) {
        report.add(std::string(field) + ": must be at most 0.0 dB (got " + fmt(value) + ")");
    }
}

}  // namespace

EffectKind effectKindOf(const EffectConfig& effect) {
    return std::visit([](const auto& p) -> EffectKind {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReverbParams>) {
            return EffectKind::REVERB;
        } else if constexpr (std::is_same_v<T, EchoParams>) {
            return EffectKind::ECHO;
        } else if constexpr (std::is_same_v<T, EqualizerParams>) {
            return EffectKind::EQUALIZER;
        } else if constexpr (std::is_same_v<T, ChorusParams>) {
            return EffectKind::CHORUS;
        } else if constexpr (std::is_same_v<T, CompressorParams>) {
            return EffectKind::COMPRESSOR;
        } else if constexpr (std::is_same_v<T, DistortionParams>) {
            return EffectKind::DISTORTION;
        } else if constexpr (std::is_same_v<T, NoiseGateParams>) {
            return EffectKind::NOISE_GATE;
        } else if constexpr (std::is_same_v<T, PitchShiftParams>) {
            return EffectKind::PITCH_SHIFT;
        } else if constexpr (std::is_same_v<T, TimeStretchParams>) {
            return EffectKind::TIME_STRETCH;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled effect type");
        }
    }, effect);
}

bool parseEffectKind(const std::string& name, EffectKind& kind) {
    static const EffectKind kAll[] = {
        EffectKind::REVERB, EffectKind::ECHO, EffectKind::EQUALIZER,
        EffectKind::CHORUS, EffectKind::COMPRESSOR, EffectKind::DISTORTION,
        EffectKind::NOISE_GATE, EffectKind::PITCH_SHIFT, EffectKind::TIME_STRETCH,
    };
    for (EffectKind k : kAll) {
        if (name == effectKindToString(k)) {
            kind = k;
            return true;
        }
    }
    // 兼容简写
    if (name == "eq") {
        kind = EffectKind::EQUALIZER;
        return true;
    }
    return false;
}

// =============================================================================
// 校验
// =============================================================================

ValidationReport validateEffect(const EffectConfig& effect) {
    ValidationReport report;

    std::visit([&report](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReverbParams>) {
            checkUnit(report, "room_size", p.room_size);
            checkUnit(report, "damping", p.damping);
        } else if constexpr (std::is_same_v<T, EchoParams>) {
            checkPositive(report, "delay_ms", p.delay_ms);
            if (!(p.feedback >= 0.0f && p.feedback < 1.0f)) {
                report.add("feedback: must be in [0.0, 1.0) (got " + fmt(p.feedback) + ")");
            }
        } else if constexpr (std::is_same_v<T, EqualizerParams>) {
            checkBandGain(report, "bass", p.bass);
            checkBandGain(report, "mid", p.mid);
            checkBandGain(report, "treble", p.treble);
        } else if constexpr (std::is_same_v<T, ChorusParams>) {
            checkUnit(report, "depth", p.depth);
            checkPositive(report, "rate", p.rate);
        } else if constexpr (std::is_same_v<T, CompressorParams>) {
            if (!(p.ratio >= 1.0f) || !std::isfinite(p.ratio)) {
                report.add("ratio: must be at least 1.0 (got " + fmt(p.ratio) + ")");
            }
            checkNonPositiveDb(report, "threshold_db", p.threshold_db);
        } else if constexpr (std::is_same_v<T, DistortionParams>) {
            checkUnit(report, "amount", p.amount);
        } else if constexpr (std::is_same_v<T, NoiseGateParams>) {
            checkNonPositiveDb(report, "threshold_db", p.threshold_db);
        } else if constexpr (std::is_same_v<T, PitchShiftParams>) {
            if (!std::isfinite(p.semitones) || std::abs(p.semitones) > 24.0f) {
                report.add("semitones: must be between -24.0 and +24.0 (got " + fmt(p.semitones) + ")");
            }
        } else if constexpr (std::is_same_v<T, TimeStretchParams>) {
            if (!(p.factor >= audio::kMinStretchRate && p.factor <= audio::kMaxStretchRate)) {
                report.add("factor: must be between 0.01 and 100.0 (got " + fmt(p.factor) + ")");
            }
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled effect type");
        }
    }, effect);

    return report;
}

// =============================================================================
// 描述
// =============================================================================

std::string describeEffect(const EffectConfig& effect) {
    std::string params = std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReverbParams>) {
            return "room_size=" + fmt(p.room_size) + ",damping=" + fmt(p.damping);
        } else if constexpr (std::is_same_v<T, EchoParams>) {
            return "delay_ms=" + fmt(p.delay_ms) + ",feedback=" + fmt(p.feedback);
        } else if constexpr (std::is_same_v<T, EqualizerParams>) {
            return "bass=" + fmt(p.bass) + ",mid=" + fmt(p.mid) + ",treble=" + fmt(p.treble);
        } else if constexpr (std::is_same_v<T, ChorusParams>) {
            return "depth=" + fmt(p.depth) + ",rate=" + fmt(p.rate);
        } else if constexpr (std::is_same_v<T, CompressorParams>) {
            return "ratio=" + fmt(p.ratio) + ",threshold_db=" + fmt(p.threshold_db);
        } else if constexpr (std::is_same_v<T, DistortionParams>) {
            return "amount=" + fmt(p.amount);
        } else if constexpr (std::is_same_v<T, NoiseGateParams>) {
            return "threshold_db=" + fmt(p.threshold_db);
        } else if constexpr (std::is_same_v<T, PitchShiftParams>) {
            return "semitones=" + fmt(p.semitones);
        } else if constexpr (std::is_same_v<T, TimeStretchParams>) {
            return "factor=" + fmt(p.factor);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled effect type");
        }
    }, effect);

    return std::string(effectKindToString(effectKindOf(effect))) + "(" + params + ")";
}

}  // namespace voice
