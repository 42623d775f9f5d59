#ifndef TONE_SYNTH_BACKEND_HPP
#define TONE_SYNTH_BACKEND_HPP

#include <string>

#include "internal/backends/speech_backend.hpp"

namespace voice {

/**
 * ToneSynthBackend - 离线确定性合成
 *
 * 每个字符生成一段带谐波的短音, 空白与标点生成静音。
 * 不需要模型文件, 同样的输入总是得到同样的字节, 适合离线演示与测试。
 */
class ToneSynthBackend : public ISpeechBackend {
public:
    ToneSynthBackend() = default;
    ~ToneSynthBackend() override;

    // 禁止拷贝
    ToneSynthBackend(const ToneSynthBackend&) = delete;
    ToneSynthBackend& operator=(const ToneSynthBackend&) = delete;

    ErrorInfo initialize(const EngineConfig& config) override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }

    std::string getName() const override { return "tone"; }
    bool supportsRecognition() const override { return false; }

    ErrorInfo synthesize(const SynthesisRequest& request, AudioData& audio) override;

    int getSampleRate() const { return sample_rate_; }

private:
    bool initialized_ = false;
    int sample_rate_ = 22050;
};

}  // namespace voice

#endif  // TONE_SYNTH_BACKEND_HPP
