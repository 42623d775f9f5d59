#include "internal/emotion/emotion_engine.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace voice {

nlohmann::json EmotionModifiers::toJson() const {
    nlohmann::json json = {
        {"emotion", emotion},
        {"intensity", intensity},
        {"pitch_shift", pitch_shift},
        {"speed_multiplier", speed_multiplier},
        {"volume_multiplier", volume_multiplier},
        {"pitch_variance", pitch_variance},
    };
    if (has_finals) {
        json["final_pitch"] = final_pitch;
        json["final_speed"] = final_speed;
        json["final_volume"] = final_volume;
    }
    return json;
}

EmotionEngine::EmotionEngine(std::shared_ptr<const EmotionTable> table)
    : table_(std::move(table)) {
}

ErrorInfo EmotionEngine::applyEmotion(const std::string& emotion,
    float intensity,
    const VoiceProfile* base_profile,
    EmotionModifiers& out) const {
    const EmotionBaseline* baseline = table_ ? table_->find(emotion) : nullptr;
    if (!baseline) {
        std::cerr << "[EmotionEngine] Unknown emotion: " << emotion << std::endl;
        ErrorInfo err = ErrorInfo::error(ErrorCode::UNKNOWN_EMOTION, "Unknown emotion: " + emotion);
        err.field = "emotion";
        return err;
    }

    if (!(intensity >= 0.0f && intensity <= 1.0f)) {
        std::cerr << "[EmotionEngine] Intensity out of range: " << intensity << std::endl;
        return ErrorInfo::fieldError(ErrorCode::VALIDATION_FAILED, "intensity",
            "intensity: must be between 0.0 and 1.0 (got " + std::to_string(intensity) + ")");
    }

    EmotionModifiers modifiers;
    modifiers.emotion = emotion;
    modifiers.intensity = intensity;
    modifiers.pitch_shift = baseline->pitch_delta * intensity;
    modifiers.speed_multiplier = 1.0f + (baseline->speed_multiplier - 1.0f) * intensity;
    modifiers.volume_multiplier = 1.0f + (baseline->volume_multiplier - 1.0f) * intensity;
    modifiers.pitch_variance = 1.0f + (baseline->pitch_variance - 1.0f) * intensity;

    if (base_profile) {
        modifiers.has_finals = true;
        modifiers.final_pitch = base_profile->pitch + modifiers.pitch_shift;
        modifiers.final_speed = base_profile->speed * modifiers.speed_multiplier;
        modifiers.final_volume = base_profile->volume * modifiers.volume_multiplier;
    }

    out = modifiers;
    return ErrorInfo::ok();
}

std::vector<std::string> EmotionEngine::listEmotions() const {
    return table_ ? table_->list() : std::vector<std::string>();
}

bool EmotionEngine::hasEmotion(const std::string& emotion) const {
    return table_ && table_->contains(emotion);
}

}  // namespace voice
