#ifndef EFFECT_PROCESSOR_HPP
#define EFFECT_PROCESSOR_HPP

#include <string>
#include <vector>

#include "internal/effects/effect_config.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Effect Processor Interface (效果处理器抽象接口)
// =============================================================================
//
// AudioEffects 只负责效果链的顺序与校验, 采样级渲染委托给处理器。
// 每次调用都是纯函数: 输入不被修改, 结果写入 out。
//
// 已实现的处理器:
// - PcmEffectProcessor: pcm_s16le / wav (16-bit 单声道)
//

class IEffectProcessor {
public:
    virtual ~IEffectProcessor() = default;

    /// @brief 获取处理器名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 应用单个效果
    /// @param input 输入音频
    /// @param effect 效果参数 (已校验)
    /// @param output [out] 处理结果, processing_history 由调用方维护
    /// @return 错误信息
    virtual ErrorInfo process(const AudioData& input,
                              const EffectConfig& effect,
                              AudioData& output) = 0;
};

// =============================================================================
// PcmEffectProcessor
// =============================================================================

class PcmEffectProcessor : public IEffectProcessor {
public:
    std::string getName() const override { return "PcmEffectProcessor"; }

    ErrorInfo process(const AudioData& input,
                      const EffectConfig& effect,
                      AudioData& output) override;

    /// @brief 直接在 float 采样上渲染效果 (供测试与变换模块复用)
    static std::vector<float> render(const std::vector<float>& samples,
                                     const EffectConfig& effect,
                                     int sample_rate);
};

}  // namespace voice

#endif  // EFFECT_PROCESSOR_HPP
