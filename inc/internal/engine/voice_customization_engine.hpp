#ifndef VOICE_CUSTOMIZATION_ENGINE_HPP
#define VOICE_CUSTOMIZATION_ENGINE_HPP

/**
 * VoiceCustomizationEngine - 音色定制引擎
 *
 * 组合三种相互独立的变换:
 *   1. 静态音色档案 (VoiceProfile)
 *   2. 情绪调制 (EmotionEngine)
 *   3. 有序效果链 (AudioEffects)
 *
 * applyVoiceProfile 的顺序固定: 校验档案 -> 情绪修正 -> 韵律调整 -> 效果链。
 * 任一阶段失败都返回该阶段的错误, 不产生输出, 输入不被修改。
 *
 * 预设表与情绪表以只读形式注入, 存储通过 IProfileStore 注入。
 */

#include <memory>
#include <string>
#include <vector>

#include "internal/effects/audio_effects.hpp"
#include "internal/emotion/emotion_engine.hpp"
#include "internal/emotion/emotion_table.hpp"
#include "internal/profile/preset_registry.hpp"
#include "internal/profile/voice_profile.hpp"
#include "internal/storage/profile_store.hpp"
#include "internal/transform/voice_transformer.hpp"
#include "internal/voice_types.hpp"

namespace voice {

class VoiceCustomizationEngine {
public:
    /**
     * @param store 档案存储 (必需)
     * @param presets 预设表 (nullptr 使用内置预设)
     * @param emotions 情绪表 (nullptr 使用内置情绪)
     * @param processor 效果处理器 (nullptr 使用 PcmEffectProcessor)
     */
    VoiceCustomizationEngine(std::shared_ptr<IProfileStore> store,
                             std::shared_ptr<const PresetRegistry> presets = nullptr,
                             std::shared_ptr<const EmotionTable> emotions = nullptr,
                             std::shared_ptr<IEffectProcessor> processor = nullptr);

    // 禁止拷贝
    VoiceCustomizationEngine(const VoiceCustomizationEngine&) = delete;
    VoiceCustomizationEngine& operator=(const VoiceCustomizationEngine&) = delete;

    // -------------------------------------------------------------------------
    // 档案
    // -------------------------------------------------------------------------

    /**
     * @brief 创建并保存自定义音色
     * @param name 名称 (总是使用此参数, 不从预设继承)
     * @param base_preset 基础预设名称, 为空则使用默认字段
     * @param overrides 覆盖字段, 在预设之上生效
     * @param out [out] 已保存的档案
     * @return UNKNOWN_PRESET / VALIDATION_FAILED / 存储错误
     */
    ErrorInfo createCustomVoice(const std::string& name,
                                const std::string& base_preset,
                                const ProfileOverrides& overrides,
                                VoiceProfile& out);

    /**
     * @brief 更新已保存的档案 (profile_id 与 name 保持不变)
     * @return NOT_FOUND / VALIDATION_FAILED / 存储错误
     */
    ErrorInfo updateProfile(const std::string& profile_id,
                            const ProfileOverrides& overrides,
                            VoiceProfile& out);

    ErrorInfo loadSavedProfile(const std::string& profile_id, VoiceProfile& out);

    ErrorInfo listSavedProfiles(std::vector<ProfileSummary>& summaries);

    bool deleteSavedProfile(const std::string& profile_id);

    /// @brief 档案校验 + 默认情绪必须在情绪表中
    ValidationReport validateProfile(const VoiceProfile& profile) const;

    // -------------------------------------------------------------------------
    // 应用
    // -------------------------------------------------------------------------

    /**
     * @brief 将档案、情绪与效果链应用到音频
     * @param audio 输入音频
     * @param profile 音色档案
     * @param emotion 情绪名称, 为空表示不使用情绪
     * @param intensity 情绪强度 [0, 1]
     * @param effects 效果链 (按顺序应用)
     * @param out [out] 处理结果
     * @return 第一个失败阶段的错误
     */
    ErrorInfo applyVoiceProfile(const AudioData& audio,
                                const VoiceProfile& profile,
                                const std::string& emotion,
                                float intensity,
                                const std::vector<EffectConfig>& effects,
                                AudioData& out) const;

    ErrorInfo applyEmotion(const std::string& emotion,
                           float intensity,
                           const VoiceProfile* base_profile,
                           EmotionModifiers& out) const {
        return emotion_engine_.applyEmotion(emotion, intensity, base_profile, out);
    }

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    std::vector<std::string> getPresetList() const { return presets_->list(); }

    /// @brief 预设的字段集合
    ErrorInfo getPreset(const std::string& name, VoiceProfile& out) const {
        return presets_->get(name, out);
    }

    std::vector<std::string> getEmotionList() const { return emotion_engine_.listEmotions(); }

    const AudioEffects& getEffects() const { return effects_; }
    const VoiceTransformer& getTransformer() const { return transformer_; }
    const EmotionEngine& getEmotionEngine() const { return emotion_engine_; }
    const std::shared_ptr<IProfileStore>& getStore() const { return store_; }

private:
    /// @brief 生成存储中尚未使用的 ID
    std::string newProfileId();

    /// @brief 校验并保存
    ErrorInfo persist(const VoiceProfile& profile);

    std::shared_ptr<IProfileStore> store_;
    std::shared_ptr<const PresetRegistry> presets_;
    std::shared_ptr<const EmotionTable> emotions_;
    EmotionEngine emotion_engine_;
    AudioEffects effects_;
    VoiceTransformer transformer_;
};

}  // namespace voice

#endif  // VOICE_CUSTOMIZATION_ENGINE_HPP
