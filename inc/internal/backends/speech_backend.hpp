#ifndef SPEECH_BACKEND_HPP
#define SPEECH_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/text/text_normalizer.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Synthesis Request / Recognition Result
// =============================================================================

struct SynthesisRequest {
    std::string text;
    std::string voice = "default";
    std::string language = "en-US";
    float speed = 1.0f;                 ///< 语速倍率 (> 0)
};

struct RecognitionResult {
    std::string text;
    float confidence = 0.0f;            ///< [0, 1]
    std::string language;
};

// =============================================================================
// Speech Backend Interface (语音后端抽象接口)
// =============================================================================
//
// TTS / STT 的外部协作者。核心只依赖此接口, 后端按名称由工厂创建。
//
// 实现新后端的步骤:
// 1. 继承 ISpeechBackend
// 2. 实现所有纯虚函数
// 3. 在 SpeechBackendFactory 中注册
//
// 已实现的后端:
// - ToneSynthBackend:  "tone", 离线确定性合成 (无识别)
// - HttpSpeechBackend: "http", 远程语音服务 (libcurl)
//

class ISpeechBackend {
public:
    virtual ~ISpeechBackend() = default;

    // -------------------------------------------------------------------------
    // 生命周期管理
    // -------------------------------------------------------------------------

    /// @brief 初始化后端
    /// @param config 配置参数
    /// @return 错误信息, OK表示成功
    virtual ErrorInfo initialize(const EngineConfig& config) = 0;

    /// @brief 释放资源
    virtual void shutdown() = 0;

    /// @brief 检查是否已初始化
    virtual bool isInitialized() const = 0;

    // -------------------------------------------------------------------------
    // 后端信息
    // -------------------------------------------------------------------------

    /// @brief 获取后端名称 (工厂键, 同时用于日志)
    virtual std::string getName() const = 0;

    /// @brief 是否支持语音识别
    virtual bool supportsRecognition() const = 0;

    // -------------------------------------------------------------------------
    // 合成 / 识别
    // -------------------------------------------------------------------------

    /// @brief 同步合成文本
    /// @param request 合成请求
    /// @param audio [out] 合成结果
    /// @return INVALID_TEXT / TEXT_TOO_LONG / BACKEND_ERROR / NOT_INITIALIZED
    virtual ErrorInfo synthesize(const SynthesisRequest& request, AudioData& audio) = 0;

    /// @brief 同步识别音频
    /// @param audio 输入音频
    /// @param language 语言区域代码
    /// @param result [out] 识别结果
    /// @return BACKEND_ERROR / NOT_INITIALIZED
    virtual ErrorInfo recognize(const AudioData& audio,
                                const std::string& language,
                                RecognitionResult& result) {
        (void)audio;
        (void)language;
        (void)result;
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR,
            "Speech recognition not supported by backend: " + getName());
    }

protected:
    /// @brief 合成前的文本检查 (空文本 / 超长文本)
    static ErrorInfo checkText(const std::string& text) {
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Text is empty");
        }
        if (!text::isValidUtf8(text)) {
            return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Text is not valid UTF-8");
        }
        // 按 UTF-8 字符计数
        size_t length = 0;
        for (unsigned char c : text) {
            if ((c & 0xC0) != 0x80) ++length;
        }
        if (length > kMaxSynthesisChars) {
            return ErrorInfo::error(ErrorCode::TEXT_TOO_LONG,
                "Text exceeds maximum length of " + std::to_string(kMaxSynthesisChars) + " characters",
                "length=" + std::to_string(length));
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Backend Factory (后端工厂)
// =============================================================================

class SpeechBackendFactory {
public:
    /// @brief 按名称创建后端
    /// @param engine 后端名称
    /// @param backend [out] 后端实例 (未初始化)
    /// @return UNSUPPORTED_ENGINE
    static ErrorInfo create(const std::string& engine, std::unique_ptr<ISpeechBackend>& backend);

    /// @brief 检查后端是否可用
    static bool isAvailable(const std::string& engine);

    /// @brief 获取所有可用的后端名称
    static std::vector<std::string> getAvailableBackends();
};

}  // namespace voice

#endif  // SPEECH_BACKEND_HPP
