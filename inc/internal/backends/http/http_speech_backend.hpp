#ifndef HTTP_SPEECH_BACKEND_HPP
#define HTTP_SPEECH_BACKEND_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/backends/speech_backend.hpp"

namespace voice {

/**
 * HttpSpeechBackend - 远程语音服务
 *
 * 协议:
 *   POST {endpoint}/synthesize              JSON {text, voice, language, speed}
 *        -> 音频字节, 格式取自 Content-Type (audio/wav -> wav, 其他 -> pcm_s16le)
 *   POST {endpoint}/recognize?language=xx   音频字节
 *        -> JSON {text, confidence, language}
 *
 * 传输失败、非 2xx 响应、响应格式错误都返回 BACKEND_ERROR, 不重试。
 */
class HttpSpeechBackend : public ISpeechBackend {
public:
    HttpSpeechBackend() = default;
    ~HttpSpeechBackend() override;

    // 禁止拷贝
    HttpSpeechBackend(const HttpSpeechBackend&) = delete;
    HttpSpeechBackend& operator=(const HttpSpeechBackend&) = delete;

    ErrorInfo initialize(const EngineConfig& config) override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }

    std::string getName() const override { return "http"; }
    bool supportsRecognition() const override { return true; }

    ErrorInfo synthesize(const SynthesisRequest& request, AudioData& audio) override;

    ErrorInfo recognize(const AudioData& audio,
                        const std::string& language,
                        RecognitionResult& result) override;

    /**
     * @brief 解析识别服务返回的 JSON
     * @param body 响应体 {text, confidence?, language?}
     * @param language 请求语言, 响应未给出时使用
     * @param result [out] 识别结果, confidence 截断到 [0, 1]
     * @return BACKEND_ERROR (不是 JSON 或缺少 text)
     */
    static ErrorInfo parseRecognition(const std::vector<uint8_t>& body,
                                      const std::string& language,
                                      RecognitionResult& result);

private:
    struct HttpResponse {
        long status = 0;
        std::string content_type;
        std::vector<uint8_t> body;
    };

    /// @brief 发送 POST 请求
    ErrorInfo post(const std::string& url,
                   const std::string& content_type,
                   const uint8_t* data,
                   size_t size,
                   HttpResponse& response) const;

    bool initialized_ = false;
    std::string endpoint_;
    std::string api_key_;
    long timeout_ms_ = 30000;
    int sample_rate_ = 22050;
};

}  // namespace voice

#endif  // HTTP_SPEECH_BACKEND_HPP
