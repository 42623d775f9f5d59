#ifndef VOICE_API_HPP
#define VOICE_API_HPP

/**
 * VoxStudio SDK - 音色定制引擎
 *
 * 在语音合成 / 识别后端之上提供音色档案、情绪调制与效果链的统一 C++ 接口。
 *
 * 使用示例 1 - 创建音色并合成:
 *
 *   Vox::VoiceStudio studio(Vox::VoiceConfig::InMemory());
 *   Vox::VoiceInfo voice;
 *   auto status = studio.CreateVoice("Narrator", "narrator_deep",
 *                                    Vox::VoiceOverrides().withPitch(-1.0f), voice);
 *   if (status.IsSuccess()) {
 *       auto result = studio.Speak("Hello world", voice.profile_id);
 *       if (result->IsSuccess()) {
 *           result->SaveToFile("hello.wav");
 *       }
 *   }
 *
 * 使用示例 2 - 情绪与效果链:
 *
 *   Vox::SpeakOptions options;
 *   options.emotion = "happy";
 *   options.emotion_intensity = 0.7f;
 *   options.effects = {"equalizer:bass=3", "reverb:room_size=0.6"};
 *   auto result = studio.Speak("Good news!", voice.profile_id, options);
 *
 * 使用示例 3 - 远程后端:
 *
 *   auto config = Vox::VoiceConfig::Http("http://localhost:8080").withApiKey("token");
 *   Vox::VoiceStudio studio(config);
 *   auto text = studio.Transcribe("recording.wav");
 */

#include <cstdint>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration of internal types
namespace voice {
    struct AudioData;
    struct ErrorInfo;
}  // namespace voice

namespace Vox {

// =============================================================================
// VoiceConfig - 引擎配置
// =============================================================================

struct VoiceConfig {
    // -------------------------------------------------------------------------
    // 语音后端
    // -------------------------------------------------------------------------

    std::string engine = "tone";        ///< 后端名称 (tone / http)
    std::string language = "en-US";     ///< 默认语言
    std::string voice = "default";      ///< 后端音色名称
    int sample_rate = 22050;            ///< 合成采样率 (Hz)

    // -------------------------------------------------------------------------
    // HTTP 后端
    // -------------------------------------------------------------------------

    std::string http_endpoint;          ///< 服务地址
    std::string api_key;                ///< Bearer token (可选)
    long http_timeout_ms = 30000;       ///< 请求超时

    // -------------------------------------------------------------------------
    // 存储 / 输出
    // -------------------------------------------------------------------------

    std::string storage_path = "~/.cache/vox-studio/profiles";  ///< 空则使用内存存储
    std::string output_dir = "./audio_output";                  ///< Export 的根目录

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 默认配置 (离线 tone 后端, JSON 文件存储)
    static VoiceConfig Default() {
        return VoiceConfig();
    }

    /// @brief 内存存储配置
    static VoiceConfig InMemory() {
        VoiceConfig config;
        config.storage_path.clear();
        return config;
    }

    /// @brief HTTP 后端配置
    /// @param endpoint 服务地址, 如 http://localhost:8080
    static VoiceConfig Http(const std::string& endpoint) {
        VoiceConfig config;
        config.engine = "http";
        config.http_endpoint = endpoint;
        return config;
    }

    // 链式配置
    VoiceConfig withEngine(const std::string& name) const {
        auto c = *this;
        c.engine = name;
        return c;
    }

    VoiceConfig withLanguage(const std::string& lang) const {
        auto c = *this;
        c.language = lang;
        return c;
    }

    VoiceConfig withSampleRate(int rate) const {
        auto c = *this;
        c.sample_rate = rate;
        return c;
    }

    VoiceConfig withStoragePath(const std::string& path) const {
        auto c = *this;
        c.storage_path = path;
        return c;
    }

    VoiceConfig withOutputDir(const std::string& dir) const {
        auto c = *this;
        c.output_dir = dir;
        return c;
    }

    VoiceConfig withApiKey(const std::string& key) const {
        auto c = *this;
        c.api_key = key;
        return c;
    }
};

// =============================================================================
// Status - 操作状态
// =============================================================================

struct Status {
    std::string code = "OK";            ///< 错误码名称, 如 VALIDATION_FAILED
    std::string message;
    std::vector<std::string> errors;    ///< 全部校验错误
    std::string field;                  ///< 出错字段 (单字段错误, 如 base_preset)
    int effect_position = 0;            ///< 效果链出错位置 (从 1 开始, 0 表示无)
    std::string effect_kind;            ///< 效果链出错的效果类型

    bool IsSuccess() const { return code == "OK"; }
};

// =============================================================================
// VoiceInfo / VoiceOverrides - 音色档案
// =============================================================================

struct VoiceInfo {
    std::string profile_id;
    std::string name;
    std::string gender;
    float pitch = 0.0f;                 ///< 半音 [-12, 12]
    float speed = 1.0f;                 ///< [0.5, 2.0]
    float volume = 1.0f;                ///< [0.0, 2.0]
    std::map<std::string, float> timbre;
    std::string language;
    std::string accent;
    std::string age_range;
    std::string emotion_default;
    std::string custom_params;          ///< JSON 文本
    std::string created_at;
    std::string updated_at;
};

/**
 * @brief 创建 / 更新音色时覆盖的字段, 未设置的字段保持预设或原值
 */
struct VoiceOverrides {
    std::optional<std::string> gender;
    std::optional<float> pitch;
    std::optional<float> speed;
    std::optional<float> volume;
    std::optional<std::map<std::string, float>> timbre;
    std::optional<std::string> language;
    std::optional<std::string> accent;
    std::optional<std::string> age_range;
    std::optional<std::string> emotion_default;
    std::optional<std::string> custom_params;   ///< JSON 对象文本, 原样保存

    VoiceOverrides withGender(const std::string& g) const {
        auto o = *this;
        o.gender = g;
        return o;
    }

    VoiceOverrides withPitch(float p) const {
        auto o = *this;
        o.pitch = p;
        return o;
    }

    VoiceOverrides withSpeed(float s) const {
        auto o = *this;
        o.speed = s;
        return o;
    }

    VoiceOverrides withVolume(float v) const {
        auto o = *this;
        o.volume = v;
        return o;
    }

    VoiceOverrides withTimbre(const std::map<std::string, float>& t) const {
        auto o = *this;
        o.timbre = t;
        return o;
    }

    VoiceOverrides withLanguage(const std::string& lang) const {
        auto o = *this;
        o.language = lang;
        return o;
    }

    VoiceOverrides withEmotion(const std::string& emotion) const {
        auto o = *this;
        o.emotion_default = emotion;
        return o;
    }

    VoiceOverrides withCustomParams(const std::string& json_object) const {
        auto o = *this;
        o.custom_params = json_object;
        return o;
    }
};

// =============================================================================
// SpeakOptions - 合成 / 处理选项
// =============================================================================

struct SpeakOptions {
    std::string emotion;                ///< 为空表示不使用情绪
    float emotion_intensity = 1.0f;     ///< [0, 1]
    std::vector<std::string> effects;   ///< 效果描述, 如 "reverb:room_size=0.6", 按顺序应用
    bool remove_punctuation = false;    ///< 合成前去除标点
    bool lowercase = false;             ///< 合成前转小写
};

// =============================================================================
// VoiceResult - 音频 / 识别结果
// =============================================================================

class VoiceResult {
public:
    VoiceResult();
    ~VoiceResult();

    // 禁止拷贝，允许移动
    VoiceResult(const VoiceResult&) = delete;
    VoiceResult& operator=(const VoiceResult&) = delete;
    VoiceResult(VoiceResult&&) noexcept;
    VoiceResult& operator=(VoiceResult&&) noexcept;

    // -------------------------------------------------------------------------
    // 状态检查
    // -------------------------------------------------------------------------

    bool IsSuccess() const;

    /// @brief 错误码名称 (成功时为 "OK")
    std::string GetCode() const;

    std::string GetMessage() const;

    /// @brief 全部校验错误 (效果链失败时包含出错效果的错误)
    std::vector<std::string> GetErrors() const;

    /// @brief 效果链失败的位置 (从 1 开始, 0 表示无)
    int GetEffectPosition() const;

    /// @brief 效果链失败的效果类型, 如 "reverb" (无则为空)
    std::string GetEffectKind() const;

    /// @brief 单字段错误的字段名 (无则为空)
    std::string GetField() const;

    // -------------------------------------------------------------------------
    // 音频
    // -------------------------------------------------------------------------

    /// @brief 编码后的音频字节
    std::vector<uint8_t> GetAudioData() const;

    /// @brief 格式标识 (pcm_s16le / wav / ...)
    std::string GetFormat() const;

    int GetSampleRate() const;

    int GetDurationMs() const;

    /// @brief 已应用的处理步骤 (按顺序)
    std::vector<std::string> GetHistory() const;

    // -------------------------------------------------------------------------
    // 识别
    // -------------------------------------------------------------------------

    /// @brief 识别文本 (仅 Transcribe)
    std::string GetText() const;

    float GetConfidence() const;

    // -------------------------------------------------------------------------
    // 文件操作
    // -------------------------------------------------------------------------

    /// @brief 保存到文件 (pcm_s16le 写入 .wav 时自动加 WAV 头)
    /// @param file_path 文件路径
    /// @return 是否成功
    bool SaveToFile(const std::string& file_path) const;

private:
    friend class VoiceStudio;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// VoiceStudio - 引擎
// =============================================================================

class VoiceStudio {
public:
    explicit VoiceStudio(const VoiceConfig& config = VoiceConfig::Default());
    ~VoiceStudio();

    // 禁止拷贝
    VoiceStudio(const VoiceStudio&) = delete;
    VoiceStudio& operator=(const VoiceStudio&) = delete;

    // -------------------------------------------------------------------------
    // 音色档案
    // -------------------------------------------------------------------------

    /**
     * @brief 创建并保存音色
     * @param name 名称
     * @param base_preset 基础预设 (为空则使用默认字段)
     * @param overrides 覆盖字段
     * @param out [out] 已保存的音色
     */
    Status CreateVoice(const std::string& name,
                       const std::string& base_preset,
                       const VoiceOverrides& overrides,
                       VoiceInfo& out);

    Status UpdateVoice(const std::string& profile_id,
                       const VoiceOverrides& overrides,
                       VoiceInfo& out);

    Status GetVoice(const std::string& profile_id, VoiceInfo& out);

    /// @brief 列出已保存的音色 (只包含 id / name / gender / language / created_at)
    Status ListVoices(std::vector<VoiceInfo>& out);

    bool DeleteVoice(const std::string& profile_id);

    /**
     * @brief 从 JSON 对象文本解析覆盖字段
     * @param json_text 如 {"pitch": -1.0, "custom_params": {"style": "news"}}
     * @param out [out] 解析结果
     * @return 未知字段 / name / profile_id / 类型错误全部列在 errors 中
     */
    static Status ParseOverrides(const std::string& json_text, VoiceOverrides& out);

    // -------------------------------------------------------------------------
    // 音频
    // -------------------------------------------------------------------------

    /**
     * @brief 合成文本并应用音色
     * @param text 文本 (最多 5000 个字符)
     * @param profile_id 音色 ID
     * @param options 情绪 / 效果链 / 文本选项
     */
    std::shared_ptr<VoiceResult> Speak(const std::string& text,
                                       const std::string& profile_id,
                                       const SpeakOptions& options = SpeakOptions());

    /// @brief 对音频文件应用音色 (wav 或 pcm)
    std::shared_ptr<VoiceResult> Process(const std::string& input_path,
                                         const std::string& profile_id,
                                         const SpeakOptions& options = SpeakOptions());

    /// @brief 对音频文件应用变声预设 (male_to_female / female_to_male / robot)
    std::shared_ptr<VoiceResult> Transform(const std::string& input_path,
                                           const std::string& transform_preset);

    /// @brief 识别音频文件
    /// @param language 为空则使用配置中的语言
    std::shared_ptr<VoiceResult> Transcribe(const std::string& input_path,
                                            const std::string& language = "");

    /**
     * @brief 将结果写入输出目录
     * @param result 音频结果
     * @param relative_path 相对 output_dir 的路径
     * @param overwrite 是否覆盖已有文件
     * @param written_path [out] 实际写入的路径
     */
    Status Export(const VoiceResult& result,
                  const std::string& relative_path,
                  bool overwrite,
                  std::string& written_path);

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    std::vector<std::string> ListPresets() const;

    std::vector<std::string> ListEmotions() const;

    std::vector<std::string> ListEffects() const;

    std::vector<std::string> ListTransforms() const;

    static std::vector<std::string> ListEngines();

    VoiceConfig GetConfig() const;

    bool IsInitialized() const;

    std::string GetEngineName() const;

private:
    /// @brief 由内部错误 / 音频构造结果
    static std::shared_ptr<VoiceResult> makeResult(const voice::ErrorInfo& error,
                                                   const voice::AudioData* audio);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Vox

#endif  // VOICE_API_HPP
