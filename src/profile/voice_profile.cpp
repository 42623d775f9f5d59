#include "internal/profile/voice_profile.hpp"

#include <ctime>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_normalizer.hpp"

namespace voice {

namespace {

std::string formatValue(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

bool inRange(float value, float lo, float hi) {
    // NaN 不满足任何比较, 会被判为越界
    return value >= lo && value <= hi;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string joinValues(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& v : values) {
        if (!result.empty()) result += ", ";
        result += v;
    }
    return result;
}

}  // namespace

const std::vector<std::string>& validGenders() {
    static const std::vector<std::string> genders = {"male", "female", "neutral", "custom"};
    return genders;
}

const std::vector<std::string>& validAgeRanges() {
    static const std::vector<std::string> ages = {"child", "young", "adult", "elderly"};
    return ages;
}

// =============================================================================
// 校验
// =============================================================================

ValidationReport VoiceProfile::validate() const {
    ValidationReport report;

    if (!inRange(pitch, kMinPitch, kMaxPitch)) {
        report.add("pitch: must be between -12.0 and +12.0 semitones (got " +
            formatValue(pitch) + ")");
    }

    if (!inRange(speed, kMinSpeed, kMaxSpeed)) {
        report.add("speed: must be between 0.5 and 2.0 (got " + formatValue(speed) + ")");
    }

    if (!inRange(volume, kMinVolume, kMaxVolume)) {
        report.add("volume: must be between 0.0 and 2.0 (got " + formatValue(volume) + ")");
    }

    if (!contains(validGenders(), gender)) {
        report.add("gender: must be one of [" + joinValues(validGenders()) +
            "] (got '" + gender + "')");
    }

    if (!age_range.empty() && !contains(validAgeRanges(), age_range)) {
        report.add("age_range: must be one of [" + joinValues(validAgeRanges()) +
            "] (got '" + age_range + "')");
    }

    if (name.empty()) {
        report.add("name: must not be empty");
    }

    // 文本字段会写入 JSON, 必须是合法 UTF-8
    const std::pair<const char*, const std::string*> text_fields[] = {
        {"name", &name}, {"language", &language}, {"accent", &accent},
        {"emotion_default", &emotion_default},
    };
    for (const auto& [field, value] : text_fields) {
        if (!text::isValidUtf8(*value)) {
            report.add(std::string(field) + ": must be valid UTF-8");
        }
    }

    for (const auto& [quality, value] : timbre) {
        if (!text::isValidUtf8(quality)) {
            report.add("timbre: quality names must be valid UTF-8");
            continue;
        }
        if (!inRange(value, 0.0f, 1.0f)) {
            report.add("timbre." + quality + ": must be between 0.0 and 1.0 (got " +
                formatValue(value) + ")");
        }
    }

    return report;
}

bool VoiceProfile::operator==(const VoiceProfile& other) const {
    return profile_id == other.profile_id &&
        name == other.name &&
        gender == other.gender &&
        pitch == other.pitch &&
        speed == other.speed &&
        volume == other.volume &&
        timbre == other.timbre &&
        language == other.language &&
        accent == other.accent &&
        age_range == other.age_range &&
        emotion_default == other.emotion_default &&
        custom_params == other.custom_params &&
        created_at == other.created_at &&
        updated_at == other.updated_at;
}

// =============================================================================
// ProfileOverrides
// =============================================================================

void ProfileOverrides::applyTo(VoiceProfile& profile) const {
    if (gender) profile.gender = *gender;
    if (pitch) profile.pitch = *pitch;
    if (speed) profile.speed = *speed;
    if (volume) profile.volume = *volume;
    if (timbre) profile.timbre = *timbre;
    if (language) profile.language = *language;
    if (accent) profile.accent = *accent;
    if (age_range) profile.age_range = *age_range;
    if (emotion_default) profile.emotion_default = *emotion_default;
    if (custom_params) profile.custom_params = *custom_params;
}

std::vector<std::string> ProfileOverrides::keys() const {
    std::vector<std::string> result;
    if (gender) result.push_back("gender");
    if (pitch) result.push_back("pitch");
    if (speed) result.push_back("speed");
    if (volume) result.push_back("volume");
    if (timbre) result.push_back("timbre");
    if (language) result.push_back("language");
    if (accent) result.push_back("accent");
    if (age_range) result.push_back("age_range");
    if (emotion_default) result.push_back("emotion_default");
    if (custom_params) result.push_back("custom_params");
    return result;
}

ErrorInfo ProfileOverrides::fromJson(const nlohmann::json& json, ProfileOverrides& out) {
    if (!json.is_object()) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Overrides must be a JSON object");
    }

    ProfileOverrides overrides;
    std::vector<std::string> errors;

    for (auto it = json.begin(); it != json.end(); ++it) {
        const std::string& key = it.key();
        const auto& value = it.value();

        if (key == "name" || key == "profile_id") {
            errors.push_back(key + ": cannot be overridden");
        } else if (key == "pitch" || key == "speed" || key == "volume") {
            if (!value.is_number()) {
                errors.push_back(key + ": must be a number");
                continue;
            }
            float v = value.get<float>();
            if (key == "pitch") overrides.pitch = v;
            else if (key == "speed") overrides.speed = v;
            else overrides.volume = v;
        } else if (key == "gender" || key == "language" || key == "accent" ||
                   key == "age_range" || key == "emotion_default") {
            if (!value.is_string()) {
                errors.push_back(key + ": must be a string");
                continue;
            }
            std::string v = value.get<std::string>();
            if (key == "gender") overrides.gender = v;
            else if (key == "language") overrides.language = v;
            else if (key == "accent") overrides.accent = v;
            else if (key == "age_range") overrides.age_range = v;
            else overrides.emotion_default = v;
        } else if (key == "timbre") {
            if (!value.is_object()) {
                errors.push_back("timbre: must be an object of numbers");
                continue;
            }
            std::map<std::string, float> timbre;
            bool ok = true;
            for (auto t = value.begin(); t != value.end(); ++t) {
                if (!t.value().is_number()) {
                    errors.push_back("timbre." + t.key() + ": must be a number");
                    ok = false;
                    continue;
                }
                timbre[t.key()] = t.value().get<float>();
            }
            if (ok) overrides.timbre = timbre;
        } else if (key == "custom_params") {
            if (!value.is_object()) {
                errors.push_back("custom_params: must be an object");
                continue;
            }
            overrides.custom_params = value;
        } else {
            errors.push_back(key + ": unknown profile field");
        }
    }

    if (!errors.empty()) {
        return ErrorInfo::invalid(ErrorCode::INVALID_ARGUMENT, "Invalid profile overrides", errors);
    }

    out = overrides;
    return ErrorInfo::ok();
}

// =============================================================================
// 序列化
// =============================================================================

nlohmann::json profileToJson(const VoiceProfile& profile) {
    nlohmann::json timbre = nlohmann::json::object();
    for (const auto& [quality, value] : profile.timbre) {
        timbre[quality] = value;
    }

    return {
        {"profile_id", profile.profile_id},
        {"name", profile.name},
        {"gender", profile.gender},
        {"pitch", profile.pitch},
        {"speed", profile.speed},
        {"volume", profile.volume},
        {"timbre", timbre},
        {"language", profile.language},
        {"accent", profile.accent},
        {"age_range", profile.age_range},
        {"emotion_default", profile.emotion_default},
        {"custom_params", profile.custom_params},
        {"created_at", profile.created_at},
        {"updated_at", profile.updated_at},
    };
}

ErrorInfo profileFromJson(const nlohmann::json& json, VoiceProfile& out) {
    if (!json.is_object()) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Profile record is not a JSON object");
    }

    try {
        VoiceProfile profile;
        profile.profile_id = json.value("profile_id", std::string());
        profile.name = json.value("name", std::string());
        profile.gender = json.value("gender", profile.gender);
        profile.pitch = json.value("pitch", profile.pitch);
        profile.speed = json.value("speed", profile.speed);
        profile.volume = json.value("volume", profile.volume);
        profile.language = json.value("language", profile.language);
        profile.accent = json.value("accent", profile.accent);
        profile.age_range = json.value("age_range", profile.age_range);
        profile.emotion_default = json.value("emotion_default", profile.emotion_default);
        profile.created_at = json.value("created_at", std::string());
        profile.updated_at = json.value("updated_at", std::string());

        if (json.contains("timbre")) {
            profile.timbre = json.at("timbre").get<std::map<std::string, float>>();
        }
        if (json.contains("custom_params")) {
            profile.custom_params = json.at("custom_params");
        }

        if (profile.profile_id.empty()) {
            return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Profile record has no profile_id");
        }

        out = profile;
        return ErrorInfo::ok();
    } catch (const nlohmann::json::exception& e) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Malformed profile record", e.what());
    }
}

// =============================================================================
// 工具
// =============================================================================

std::string generateProfileId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();

    // uuid v4: version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(hi >> 32) << '-'
        << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

}  // namespace voice
