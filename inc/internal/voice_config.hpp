#ifndef VOICE_CONFIG_HPP
#define VOICE_CONFIG_HPP

#include <cstdlib>

#include <string>

#include "voice_types.hpp"

namespace voice {

// 单次合成允许的最大字符数
constexpr size_t kMaxSynthesisChars = 5000;

// =============================================================================
// Engine Config (引擎配置 - 内部使用)
// =============================================================================

struct EngineConfig {
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

    std::string http_endpoint;          ///< 服务地址, 如 http://localhost:8080
    std::string api_key;                ///< Bearer token (可选)
    long http_timeout_ms = 30000;       ///< 请求超时

    // -------------------------------------------------------------------------
    // 存储 / 输出
    // -------------------------------------------------------------------------

    std::string storage_path = "~/.cache/vox-studio/profiles";  ///< 空则使用内存存储
    std::string output_dir = "./audio_output";                  ///< 音频文件输出目录

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 默认配置 (离线 tone 后端, JSON 文件存储)
    static EngineConfig Default() {
        return EngineConfig();
    }

    /// @brief 内存存储配置 (不落盘)
    static EngineConfig InMemory() {
        EngineConfig config;
        config.storage_path.clear();
        return config;
    }

    /// @brief HTTP 后端配置
    /// @param endpoint 服务地址
    static EngineConfig Http(const std::string& endpoint) {
        EngineConfig config;
        config.engine = "http";
        config.http_endpoint = endpoint;
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    EngineConfig withEngine(const std::string& name) const {
        auto c = *this;
        c.engine = name;
        return c;
    }

    EngineConfig withLanguage(const std::string& lang) const {
        auto c = *this;
        c.language = lang;
        return c;
    }

    EngineConfig withSampleRate(int rate) const {
        auto c = *this;
        c.sample_rate = rate;
        return c;
    }

    EngineConfig withStoragePath(const std::string& path) const {
        auto c = *this;
        c.storage_path = path;
        return c;
    }

    EngineConfig withOutputDir(const std::string& dir) const {
        auto c = *this;
        c.output_dir = dir;
        return c;
    }

    EngineConfig withApiKey(const std::string& key) const {
        auto c = *this;
        c.api_key = key;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    bool usesMemoryStore() const { return storage_path.empty(); }

    /// @brief 展开 ~ 后的存储路径
    std::string getExpandedStoragePath() const {
        return expandHome(storage_path);
    }

    /// @brief 展开 ~ 后的输出目录
    std::string getExpandedOutputDir() const {
        return expandHome(output_dir);
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (engine.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Engine name is empty");
        }
        if (sample_rate <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Invalid sample rate");
        }
        if (engine == "http" && http_endpoint.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "HTTP engine requires an endpoint");
        }
        if (http_timeout_ms <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Invalid HTTP timeout");
        }
        return ErrorInfo::ok();
    }

private:
    static std::string expandHome(const std::string& path) {
        if (!path.empty() && path[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + path.substr(1);
            }
        }
        return path;
    }
};

}  // namespace voice

#endif  // VOICE_CONFIG_HPP
