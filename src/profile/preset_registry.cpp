#include "internal/profile/preset_registry.hpp"

#include <string>
#include <utility>
#include <vector>

namespace voice {

namespace {

VoiceProfile makePreset(const std::string& name,
                        const std::string& gender,
                        float pitch,
                        float speed,
                        float volume,
                        const std::string& accent,
                        const std::string& age_range) {
    VoiceProfile preset;
    preset.name = name;
    preset.gender = gender;
    preset.pitch = pitch;
    preset.speed = speed;
    preset.volume = volume;
    preset.accent = accent;
    preset.age_range = age_range;
    return preset;
}

}  // namespace

PresetRegistry::PresetRegistry(std::vector<Entry> presets)
    : presets_(std::move(presets)) {
}

PresetRegistry PresetRegistry::createBuiltin() {
    std::vector<Entry> presets;

    presets.emplace_back("professional_male",
        makePreset("Professional Male", "male", -2.0f, 0.95f, 1.0f, "american", "adult"));

    presets.emplace_back("professional_female",
        makePreset("Professional Female", "female", 2.0f, 1.0f, 1.0f, "american", "adult"));

    VoiceProfile friendly = makePreset("Friendly Assistant", "neutral", 1.0f, 1.1f, 1.0f,
        "neutral", "young");
    friendly.emotion_default = "happy";
    presets.emplace_back("friendly_assistant", friendly);

    presets.emplace_back("narrator_deep",
        makePreset("Deep Narrator", "male", -4.0f, 0.85f, 1.1f, "british", "adult"));

    presets.emplace_back("child_voice",
        makePreset("Child Voice", "neutral", 6.0f, 1.2f, 0.9f, "neutral", "child"));

    VoiceProfile elderly = makePreset("Elderly Wise", "male", -1.0f, 0.8f, 0.95f,
        "neutral", "elderly");
    elderly.custom_params = {{"tremolo", 0.3}};
    presets.emplace_back("elderly_wise", elderly);

    return PresetRegistry(std::move(presets));
}

bool PresetRegistry::contains(const std::string& name) const {
    for (const auto& entry : presets_) {
        if (entry.first == name) return true;
    }
    return false;
}

ErrorInfo PresetRegistry::get(const std::string& name, VoiceProfile& out) const {
    for (const auto& entry : presets_) {
        if (entry.first == name) {
            out = entry.second;
            return ErrorInfo::ok();
        }
    }

    ErrorInfo err = ErrorInfo::error(ErrorCode::UNKNOWN_PRESET, "Preset not found: " + name);
    err.field = "base_preset";
    return err;
}

std::vector<std::string> PresetRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(presets_.size());
    for (const auto& entry : presets_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace voice
