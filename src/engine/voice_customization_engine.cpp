#include "internal/engine/voice_customization_engine.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace voice {

namespace {

std::string joinKeys(const std::vector<std::string>& keys) {
    std::string result;
    for (const auto& k : keys) {
        if (!result.empty()) result += ",";
        result += k;
    }
    return result;
}

}  // namespace

VoiceCustomizationEngine::VoiceCustomizationEngine(std::shared_ptr<IProfileStore> store,
    std::shared_ptr<const PresetRegistry> presets,
    std::shared_ptr<const EmotionTable> emotions,
    std::shared_ptr<IEffectProcessor> processor)
    : store_(store ? std::move(store) : std::make_shared<MemoryProfileStore>()),
      presets_(presets ? std::move(presets)
                       : std::make_shared<const PresetRegistry>(PresetRegistry::createBuiltin())),
      emotions_(emotions ? std::move(emotions)
                         : std::make_shared<const EmotionTable>(EmotionTable::createBuiltin())),
      emotion_engine_(emotions_),
      effects_(std::move(processor)) {
    std::cout << "[VoiceCustomizationEngine] Ready (store=" << store_->getName()
              << ", presets=" << presets_->size()
              << ", emotions=" << emotions_->list().size() << ")" << std::endl;
}

// =============================================================================
// 校验 / 保存
// =============================================================================

ValidationReport VoiceCustomizationEngine::validateProfile(const VoiceProfile& profile) const {
    ValidationReport report = profile.validate();
    if (!emotions_->contains(profile.emotion_default)) {
        report.add("emotion_default: unknown emotion '" + profile.emotion_default + "'");
    }
    return report;
}

std::string VoiceCustomizationEngine::newProfileId() {
    std::string id = generateProfileId();
    while (store_->contains(id)) {
        id = generateProfileId();
    }
    return id;
}

ErrorInfo VoiceCustomizationEngine::persist(const VoiceProfile& profile) {
    auto report = validateProfile(profile);
    if (!report.valid) {
        std::cerr << "[VoiceCustomizationEngine] Profile '" << profile.name
                  << "' failed validation (" << report.errors.size() << " errors)" << std::endl;
        return ErrorInfo::invalid(ErrorCode::VALIDATION_FAILED,
            "Invalid voice profile: " + profile.name, report.errors);
    }

    std::string location;
    auto err = store_->saveProfile(profile, location);
    if (!err.isOk()) {
        std::cerr << "[VoiceCustomizationEngine] Failed to persist profile "
                  << profile.profile_id << ": " << err.message << std::endl;
    }
    return err;
}

// =============================================================================
// 档案
// =============================================================================

ErrorInfo VoiceCustomizationEngine::createCustomVoice(const std::string& name,
    const std::string& base_preset,
    const ProfileOverrides& overrides,
    VoiceProfile& out) {
    VoiceProfile profile;

    if (!base_preset.empty()) {
        auto err = presets_->get(base_preset, profile);
        if (!err.isOk()) {
            std::cerr << "[VoiceCustomizationEngine] " << err.message << std::endl;
            return err;
        }
    }

    overrides.applyTo(profile);
    profile.name = name;
    profile.profile_id = newProfileId();
    profile.created_at = currentTimestamp();
    profile.updated_at = profile.created_at;

    auto err = persist(profile);
    if (!err.isOk()) {
        return err;
    }

    std::cout << "[VoiceCustomizationEngine] Created profile " << profile.profile_id
              << " ('" << profile.name << "', preset=" << (base_preset.empty() ? "none" : base_preset)
              << ", overrides=[" << joinKeys(overrides.keys()) << "])" << std::endl;
    out = profile;
    return ErrorInfo::ok();
}

ErrorInfo VoiceCustomizationEngine::updateProfile(const std::string& profile_id,
    const ProfileOverrides& overrides,
    VoiceProfile& out) {
    VoiceProfile profile;
    auto err = store_->loadProfile(profile_id, profile);
    if (!err.isOk()) {
        std::cerr << "[VoiceCustomizationEngine] " << err.message << std::endl;
        return err;
    }

    overrides.applyTo(profile);
    profile.updated_at = currentTimestamp();

    err = persist(profile);
    if (!err.isOk()) {
        return err;
    }

    std::cout << "[VoiceCustomizationEngine] Updated profile " << profile_id
              << " ([" << joinKeys(overrides.keys()) << "])" << std::endl;
    out = profile;
    return ErrorInfo::ok();
}

ErrorInfo VoiceCustomizationEngine::loadSavedProfile(const std::string& profile_id, VoiceProfile& out) {
    auto err = store_->loadProfile(profile_id, out);
    if (!err.isOk()) {
        std::cerr << "[VoiceCustomizationEngine] " << err.message << std::endl;
    }
    return err;
}

ErrorInfo VoiceCustomizationEngine::listSavedProfiles(std::vector<ProfileSummary>& summaries) {
    return store_->listProfiles(summaries);
}

bool VoiceCustomizationEngine::deleteSavedProfile(const std::string& profile_id) {
    return store_->deleteProfile(profile_id);
}

// =============================================================================
// 应用
// =============================================================================

ErrorInfo VoiceCustomizationEngine::applyVoiceProfile(const AudioData& audio,
    const VoiceProfile& profile,
    const std::string& emotion,
    float intensity,
    const std::vector<EffectConfig>& effects,
    AudioData& out) const {
    auto report = validateProfile(profile);
    if (!report.valid) {
        std::cerr << "[VoiceCustomizationEngine] Refusing to apply invalid profile '"
                  << profile.name << "'" << std::endl;
        return ErrorInfo::invalid(ErrorCode::VALIDATION_FAILED,
            "Invalid voice profile: " + profile.name, report.errors);
    }

    // 1. 情绪修正 (以档案为基准), 否则使用档案自身的值
    float pitch = profile.pitch;
    float speed = profile.speed;
    float volume = profile.volume;
    if (!emotion.empty()) {
        EmotionModifiers modifiers;
        auto err = emotion_engine_.applyEmotion(emotion, intensity, &profile, modifiers);
        if (!err.isOk()) {
            return err;
        }
        pitch = modifiers.final_pitch;
        speed = modifiers.final_speed;
        volume = modifiers.final_volume;
    }

    // 2. 韵律调整
    AudioData adjusted;
    auto err = transformer_.applyProsody(audio, pitch, speed, volume, adjusted);
    if (!err.isOk()) {
        return err;
    }

    // 3. 效果链
    AudioData result;
    err = effects_.applyEffects(adjusted, effects, result);
    if (!err.isOk()) {
        return err;
    }

    out = std::move(result);
    return ErrorInfo::ok();
}

}  // namespace voice
