#include "internal/effects/audio_effects.hpp"

#include <cmath>
#include <cstdlib>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace voice {

namespace {

ErrorInfo build(const EffectConfig& candidate, EffectConfig& out) {
    auto report = validateEffect(candidate);
    if (!report.valid) {
        std::string kind = effectKindToString(effectKindOf(candidate));
        std::cerr << "[AudioEffects] Invalid " << kind << " parameters: "
                  << report.errors.front() << std::endl;
        auto err = ErrorInfo::invalid(ErrorCode::PARAMETER_RANGE,
            "Invalid " + kind + " parameters", report.errors);
        err.effect_kind = kind;
        return err;
    }
    out = candidate;
    return ErrorInfo::ok();
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool parseFloat(const std::string& text, float& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    value = std::strtof(text.c_str(), &end);
    return end != nullptr && *end == '\0';
}

EffectConfig defaultsFor(EffectKind kind) {
    switch (kind) {
        case EffectKind::REVERB:       return ReverbParams{};
        case EffectKind::ECHO:         return EchoParams{};
        case EffectKind::EQUALIZER:    return EqualizerParams{};
        case EffectKind::CHORUS:       return ChorusParams{};
        case EffectKind::COMPRESSOR:   return CompressorParams{};
        case EffectKind::DISTORTION:   return DistortionParams{};
        case EffectKind::NOISE_GATE:   return NoiseGateParams{};
        case EffectKind::PITCH_SHIFT:  return PitchShiftParams{};
        case EffectKind::TIME_STRETCH: return TimeStretchParams{};
    }
    return ReverbParams{};
}

// 返回字段指针, 未知字段返回 nullptr
float* fieldOf(EffectConfig& effect, const std::string& key) {
    if (auto* p = std::get_if<ReverbParams>(&effect)) {
        if (key == "room_size") return &p->room_size;
        if (key == "damping") return &p->damping;
    } else if (auto* p = std::get_if<EchoParams>(&effect)) {
        if (key == "delay_ms") return &p->delay_ms;
        if (key == "feedback") return &p->feedback;
    } else if (auto* p = std::get_if<EqualizerParams>(&effect)) {
        if (key == "bass") return &p->bass;
        if (key == "mid") return &p->mid;
        if (key == "treble") return &p->treble;
    } else if (auto* p = std::get_if<ChorusParams>(&effect)) {
        if (key == "depth") return &p->depth;
        if (key == "rate") return &p->rate;
    } else if (auto* p = std::get_if<CompressorParams>(&effect)) {
        if (key == "ratio") return &p->ratio;
        if (key == "threshold_db" || key == "threshold") return &p->threshold_db;
    } else if (auto* p = std::get_if<DistortionParams>(&effect)) {
        if (key == "amount") return &p->amount;
    } else if (auto* p = std::get_if<NoiseGateParams>(&effect)) {
        if (key == "threshold_db" || key == "threshold") return &p->threshold_db;
    } else if (auto* p = std::get_if<PitchShiftParams>(&effect)) {
        if (key == "semitones") return &p->semitones;
    } else if (auto* p = std::get_if<TimeStretchParams>(&effect)) {
        if (key == "factor") return &p->factor;
    }
    return nullptr;
}

}  // namespace

AudioEffects::AudioEffects()
    : processor_(std::make_shared<PcmEffectProcessor>()) {}

AudioEffects::AudioEffects(std::shared_ptr<IEffectProcessor> processor)
    : processor_(processor ? std::move(processor) : std::make_shared<PcmEffectProcessor>()) {}

// =============================================================================
// 构建
// =============================================================================

ErrorInfo AudioEffects::createReverb(EffectConfig& out, float room_size, float damping) {
    return build(ReverbParams{room_size, damping}, out);
}

ErrorInfo AudioEffects::createEcho(EffectConfig& out, float delay_ms, float feedback) {
    return build(EchoParams{delay_ms, feedback}, out);
}

ErrorInfo AudioEffects::createEqualizer(EffectConfig& out, float bass, float mid, float treble) {
    return build(EqualizerParams{bass, mid, treble}, out);
}

ErrorInfo AudioEffects::createChorus(EffectConfig& out, float depth, float rate) {
    return build(ChorusParams{depth, rate}, out);
}

ErrorInfo AudioEffects::createCompressor(EffectConfig& out, float ratio, float threshold_db) {
    return build(CompressorParams{ratio, threshold_db}, out);
}

ErrorInfo AudioEffects::createDistortion(EffectConfig& out, float amount) {
    return build(DistortionParams{amount}, out);
}

ErrorInfo AudioEffects::createNoiseGate(EffectConfig& out, float threshold_db) {
    return build(NoiseGateParams{threshold_db}, out);
}

ErrorInfo AudioEffects::createPitchShift(EffectConfig& out, float semitones) {
    return build(PitchShiftParams{semitones}, out);
}

ErrorInfo AudioEffects::createTimeStretch(EffectConfig& out, float factor) {
    return build(TimeStretchParams{factor}, out);
}

ErrorInfo AudioEffects::parseEffect(const std::string& descriptor, EffectConfig& out) {
    std::string text = trim(descriptor);
    size_t colon = text.find(':');
    std::string name = trim(text.substr(0, colon));

    EffectKind kind;
    if (!parseEffectKind(name, kind)) {
        return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, "kind",
            "Unknown effect kind: '" + name + "'");
    }

    EffectConfig effect = defaultsFor(kind);
    if (colon != std::string::npos) {
        std::string rest = text.substr(colon + 1);
        size_t pos = 0;
        while (pos <= rest.size()) {
            size_t comma = rest.find(',', pos);
            if (comma == std::string::npos) comma = rest.size();
            std::string item = trim(rest.substr(pos, comma - pos));
            pos = comma + 1;
            if (item.empty()) continue;

            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, item,
                    "Expected key=value in effect descriptor, got '" + item + "'");
            }
            std::string key = trim(item.substr(0, eq));
            std::string value_text = trim(item.substr(eq + 1));

            float* field = fieldOf(effect, key);
            if (field == nullptr) {
                return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, key,
                    "Unknown parameter '" + key + "' for effect " + effectKindToString(kind));
            }
            float value = 0.0f;
            if (!parseFloat(value_text, value)) {
                return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, key,
                    key + ": not a number ('" + value_text + "')");
            }
            *field = value;
        }
    }

    return build(effect, out);
}

// =============================================================================
// 效果链
// =============================================================================

ErrorInfo AudioEffects::applyEffects(const AudioData& audio,
    const std::vector<EffectConfig>& effects,
    AudioData& out) const {
    // 先校验全部效果, 任何一个非法都不会开始处理
    for (size_t i = 0; i < effects.size(); ++i) {
        auto report = validateEffect(effects[i]);
        if (!report.valid) {
            std::string kind = effectKindToString(effectKindOf(effects[i]));
            std::cerr << "[AudioEffects] Effect " << (i + 1) << " (" << kind
                      << ") is malformed: " << report.errors.front() << std::endl;
            auto err = ErrorInfo::invalid(ErrorCode::CHAIN_APPLICATION_FAILED,
                "Effect " + std::to_string(i + 1) + " (" + kind + ") is malformed",
                report.errors);
            err.effect_position = static_cast<int>(i + 1);
            err.effect_kind = kind;
            return err;
        }
    }

    AudioData current = audio;
    for (size_t i = 0; i < effects.size(); ++i) {
        AudioData next;
        auto err = processor_->process(current, effects[i], next);
        if (!err.isOk()) {
            std::string kind = effectKindToString(effectKindOf(effects[i]));
            std::cerr << "[AudioEffects] Effect " << (i + 1) << " (" << kind
                      << ") failed: " << err.message << std::endl;
            auto chain_err = ErrorInfo::error(ErrorCode::CHAIN_APPLICATION_FAILED,
                "Effect " + std::to_string(i + 1) + " (" + kind + ") failed: " + err.message,
                err.detail);
            chain_err.effect_position = static_cast<int>(i + 1);
            chain_err.effect_kind = kind;
            chain_err.errors.push_back(err.message);
            return chain_err;
        }
        next.processing_history = current.processing_history;
        next.processing_history.push_back(describeEffect(effects[i]));
        current = std::move(next);
    }

    out = std::move(current);
    return ErrorInfo::ok();
}

}  // namespace voice
