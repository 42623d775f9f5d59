#ifndef VOICE_PROFILE_HPP
#define VOICE_PROFILE_HPP

/**
 * VoiceProfile - 音色档案
 *
 * 描述一个音色的静态特征 (性别、音高、语速、音量、音色质感等)。
 * 档案是值对象: 修改时生成新的实例并重新校验。
 */

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// 取值范围
// =============================================================================

constexpr float kMinPitch = -12.0f;     ///< 半音
constexpr float kMaxPitch = 12.0f;
constexpr float kMinSpeed = 0.5f;       ///< 语速倍率
constexpr float kMaxSpeed = 2.0f;
constexpr float kMinVolume = 0.0f;      ///< 音量倍率
constexpr float kMaxVolume = 2.0f;

/// @brief 合法的性别取值 (male, female, neutral, custom)
const std::vector<std::string>& validGenders();

/// @brief 合法的年龄段取值 (child, young, adult, elderly)
const std::vector<std::string>& validAgeRanges();

// =============================================================================
// VoiceProfile
// =============================================================================

struct VoiceProfile {
    std::string profile_id;                     ///< 唯一标识, 创建时生成
    std::string name;                           ///< 名称 (非空)
    std::string gender = "neutral";             ///< male / female / neutral / custom
    float pitch = 0.0f;                         ///< [-12, +12] 半音
    float speed = 1.0f;                         ///< [0.5, 2.0]
    float volume = 1.0f;                        ///< [0.0, 2.0]
    std::map<std::string, float> timbre;        ///< 音色质感 -> [0, 1]
    std::string language = "en-US";             ///< 语言区域代码
    std::string accent = "neutral";             ///< 口音
    std::string age_range = "adult";            ///< child / young / adult / elderly
    std::string emotion_default = "neutral";    ///< 默认情绪
    nlohmann::json custom_params = nlohmann::json::object();  ///< 引擎相关参数, 不校验
    std::string created_at;                     ///< ISO-8601 UTC
    std::string updated_at;                     ///< ISO-8601 UTC

    /// @brief 按固定顺序检查全部字段, 收集所有错误
    /// @return 校验报告
    ValidationReport validate() const;

    bool operator==(const VoiceProfile& other) const;
    bool operator!=(const VoiceProfile& other) const { return !(*this == other); }
};

// =============================================================================
// ProfileOverrides - 覆盖字段
// =============================================================================

/**
 * @brief 创建或更新档案时的覆盖字段
 *
 * name 与 profile_id 不可覆盖: name 总是由调用方显式给出。
 */
struct ProfileOverrides {
    std::optional<std::string> gender;
    std::optional<float> pitch;
    std::optional<float> speed;
    std::optional<float> volume;
    std::optional<std::map<std::string, float>> timbre;
    std::optional<std::string> language;
    std::optional<std::string> accent;
    std::optional<std::string> age_range;
    std::optional<std::string> emotion_default;
    std::optional<nlohmann::json> custom_params;

    /// @brief 将所有已设置的字段写入档案
    void applyTo(VoiceProfile& profile) const;

    /// @brief 已设置的字段名 (用于日志)
    std::vector<std::string> keys() const;

    bool empty() const { return keys().empty(); }

    /// @brief 从 JSON 对象解析, 未知字段或保留字段 (name, profile_id) 视为错误
    static ErrorInfo fromJson(const nlohmann::json& json, ProfileOverrides& out);

    // 链式构建
    ProfileOverrides withGender(const std::string& g) const {
        auto o = *this;
        o.gender = g;
        return o;
    }

    ProfileOverrides withPitch(float p) const {
        auto o = *this;
        o.pitch = p;
        return o;
    }

    ProfileOverrides withSpeed(float s) const {
        auto o = *this;
        o.speed = s;
        return o;
    }

    ProfileOverrides withVolume(float v) const {
        auto o = *this;
        o.volume = v;
        return o;
    }

    ProfileOverrides withLanguage(const std::string& lang) const {
        auto o = *this;
        o.language = lang;
        return o;
    }

    ProfileOverrides withAgeRange(const std::string& age) const {
        auto o = *this;
        o.age_range = age;
        return o;
    }

    ProfileOverrides withEmotion(const std::string& emotion) const {
        auto o = *this;
        o.emotion_default = emotion;
        return o;
    }
};

// =============================================================================
// 序列化 / 工具
// =============================================================================

nlohmann::json profileToJson(const VoiceProfile& profile);

/// @brief 从 JSON 记录还原档案 (缺失字段取默认值, 类型错误返回 FORMAT_ERROR)
ErrorInfo profileFromJson(const nlohmann::json& json, VoiceProfile& out);

/// @brief 生成新的档案 ID (uuid v4 形式)
std::string generateProfileId();

/// @brief 当前 UTC 时间, ISO-8601 格式
std::string currentTimestamp();

}  // namespace voice

#endif  // VOICE_PROFILE_HPP
