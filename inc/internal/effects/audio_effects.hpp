#ifndef AUDIO_EFFECTS_HPP
#define AUDIO_EFFECTS_HPP

/**
 * AudioEffects - 效果构建与效果链
 *
 * 效果链按调用方给定的顺序逐个应用 (左折叠), 效果之间一般不可交换。
 * 链中任何一个效果非法或处理失败, 整条链失败, 不产生部分输出。
 * 每个成功的步骤都会向 processing_history 追加 "kind(params)"。
 */

#include <memory>
#include <string>
#include <vector>

#include "internal/effects/effect_config.hpp"
#include "internal/effects/effect_processor.hpp"
#include "internal/voice_types.hpp"

namespace voice {

class AudioEffects {
public:
    /// @brief 使用默认的 PcmEffectProcessor
    AudioEffects();

    explicit AudioEffects(std::shared_ptr<IEffectProcessor> processor);

    // -------------------------------------------------------------------------
    // 构建 (校验全部字段, 越界返回 PARAMETER_RANGE)
    // -------------------------------------------------------------------------

    static ErrorInfo createReverb(EffectConfig& out, float room_size = 0.5f, float damping = 0.5f);
    static ErrorInfo createEcho(EffectConfig& out, float delay_ms = 500.0f, float feedback = 0.3f);
    static ErrorInfo createEqualizer(EffectConfig& out, float bass = 0.0f, float mid = 0.0f, float treble = 0.0f);
    static ErrorInfo createChorus(EffectConfig& out, float depth = 0.5f, float rate = 1.5f);
    static ErrorInfo createCompressor(EffectConfig& out, float ratio = 4.0f, float threshold_db = -18.0f);
    static ErrorInfo createDistortion(EffectConfig& out, float amount = 0.5f);
    static ErrorInfo createNoiseGate(EffectConfig& out, float threshold_db = -50.0f);
    static ErrorInfo createPitchShift(EffectConfig& out, float semitones);
    static ErrorInfo createTimeStretch(EffectConfig& out, float factor);

    /**
     * @brief 从文本描述构建效果
     * @param descriptor 形如 "reverb:room_size=0.8,damping=0.2" 或 "echo"
     * @param out [out] 效果参数 (未给出的字段取默认值)
     * @return INVALID_ARGUMENT (未知类型 / 字段 / 非数字) 或 PARAMETER_RANGE
     */
    static ErrorInfo parseEffect(const std::string& descriptor, EffectConfig& out);

    // -------------------------------------------------------------------------
    // 效果链
    // -------------------------------------------------------------------------

    /**
     * @brief 按顺序应用效果链
     * @param audio 输入音频 (不被修改)
     * @param effects 效果列表, 为空时返回与输入相等的副本
     * @param out [out] 处理结果, 仅在成功时写入
     * @return CHAIN_APPLICATION_FAILED, 带出错位置 (从 1 开始) 与效果类型
     */
    ErrorInfo applyEffects(const AudioData& audio,
                           const std::vector<EffectConfig>& effects,
                           AudioData& out) const;

    const std::shared_ptr<IEffectProcessor>& getProcessor() const { return processor_; }

private:
    std::shared_ptr<IEffectProcessor> processor_;
};

}  // namespace voice

#endif  // AUDIO_EFFECTS_HPP
