#ifndef VOICE_TRANSFORMER_HPP
#define VOICE_TRANSFORMER_HPP

/**
 * VoiceTransformer - 音色变换
 *
 * 两类操作:
 *  - transformVoice: 按 VoiceTransform 依次做变调、共振峰、音色、气声、粗糙度
 *  - applyProsody:   按档案 / 情绪得到的标量做变调、变速、增益
 *
 * 恒等参数对应的阶段会被跳过。结果确定 (噪声使用固定种子)。
 */

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// VoiceTransform
// =============================================================================

struct VoiceTransform {
    float pitch_shift = 0.0f;       ///< 半音, 有限且 |p| <= 24
    float formant_shift = 1.0f;     ///< 比例 [0.5, 2.0], 1.0 为恒等
    float timbre_morph = 0.0f;      ///< [-1, +1], 负值偏暗, 正值偏亮
    float breathiness = 0.0f;       ///< [0, 1]
    float roughness = 0.0f;         ///< [0, 1]

    ValidationReport validate() const;

    bool isIdentity() const {
        return pitch_shift == 0.0f && formant_shift == 1.0f &&
            timbre_morph == 0.0f && breathiness == 0.0f && roughness == 0.0f;
    }

    // 内置预设
    static VoiceTransform MaleToFemale() {
        VoiceTransform t;
        t.pitch_shift = 4.0f;
        t.formant_shift = 1.15f;
        t.timbre_morph = 0.5f;
        return t;
    }

    static VoiceTransform FemaleToMale() {
        VoiceTransform t;
        t.pitch_shift = -4.0f;
        t.formant_shift = 0.85f;
        t.timbre_morph = -0.5f;
        return t;
    }

    static VoiceTransform Robot() {
        VoiceTransform t;
        t.timbre_morph = -1.0f;
        t.roughness = 0.8f;
        return t;
    }

    /// @brief 按名称查找预设 (male_to_female / female_to_male / robot)
    static bool fromPreset(const std::string& name, VoiceTransform& out);

    static std::vector<std::string> presetNames();
};

// =============================================================================
// VoiceTransformer
// =============================================================================

class VoiceTransformer {
public:
    /**
     * @brief 应用音色变换
     * @param audio 输入音频 (pcm_s16le 或 wav)
     * @param transform 变换参数
     * @param out [out] 处理结果
     * @return PARAMETER_RANGE / UNSUPPORTED_FORMAT / FORMAT_ERROR
     */
    ErrorInfo transformVoice(const AudioData& audio,
                             const VoiceTransform& transform,
                             AudioData& out) const;

    /**
     * @brief 应用标量韵律调整
     * @param audio 输入音频
     * @param pitch 半音 (时长不变)
     * @param speed 语速倍率 (> 0, 时长 = 原时长 / speed)
     * @param volume 音量倍率 (>= 0)
     * @param out [out] 处理结果
     * @return PARAMETER_RANGE / UNSUPPORTED_FORMAT / FORMAT_ERROR
     */
    ErrorInfo applyProsody(const AudioData& audio,
                           float pitch,
                           float speed,
                           float volume,
                           AudioData& out) const;
};

}  // namespace voice

#endif  // VOICE_TRANSFORMER_HPP
