#ifndef EMOTION_ENGINE_HPP
#define EMOTION_ENGINE_HPP

/**
 * EmotionEngine - 情绪调制
 *
 * 将 (情绪, 强度) 解析为具体的音高 / 语速 / 音量修正值。
 *
 * 强度在 "无情绪" 与 "完整情绪" 之间线性插值:
 *   pitch_shift       = pitch_delta * intensity                  (加性, 趋向 0)
 *   speed_multiplier  = 1 + (speed_multiplier  - 1) * intensity  (乘性, 趋向 1)
 *   volume_multiplier = 1 + (volume_multiplier - 1) * intensity  (乘性, 趋向 1)
 *
 * 给定基准档案时还会计算最终值, 最终值不会再被限制到档案取值范围内。
 */

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/emotion/emotion_table.hpp"
#include "internal/profile/voice_profile.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// EmotionModifiers - 情绪修正结果
// =============================================================================

struct EmotionModifiers {
    std::string emotion;
    float intensity = 0.0f;

    // 原始修正值
    float pitch_shift = 0.0f;
    float speed_multiplier = 1.0f;
    float volume_multiplier = 1.0f;
    float pitch_variance = 1.0f;

    // 最终值 (仅在提供基准档案时有效, 不做范围限制)
    bool has_finals = false;
    float final_pitch = 0.0f;
    float final_speed = 1.0f;
    float final_volume = 1.0f;

    nlohmann::json toJson() const;
};

// =============================================================================
// EmotionEngine
// =============================================================================

class EmotionEngine {
public:
    explicit EmotionEngine(std::shared_ptr<const EmotionTable> table);

    /// @brief 计算情绪修正值
    /// @param emotion 情绪名称
    /// @param intensity 强度 [0, 1], 越界直接拒绝
    /// @param base_profile 基准档案 (可为 nullptr)
    /// @param out [out] 修正结果
    /// @return UNKNOWN_EMOTION / VALIDATION_FAILED
    ErrorInfo applyEmotion(const std::string& emotion,
                           float intensity,
                           const VoiceProfile* base_profile,
                           EmotionModifiers& out) const;

    std::vector<std::string> listEmotions() const;

    bool hasEmotion(const std::string& emotion) const;

private:
    std::shared_ptr<const EmotionTable> table_;
};

}  // namespace voice

#endif  // EMOTION_ENGINE_HPP
