#ifndef VOICE_TYPES_HPP
#define VOICE_TYPES_HPP

#include <cstdint>

#include <map>
#include <string>
#include <vector>

namespace voice {

// =============================================================================
// Audio Format (音频格式)
// =============================================================================

// AudioData 的 format 字段是字符串, 这里只列出引擎能解码的格式
constexpr const char* kFormatPcmS16le = "pcm_s16le";  // 16-bit signed little-endian PCM (raw)
constexpr const char* kFormatWav = "wav";              // WAV container (PCM 16-bit mono)

inline bool isPcmFormat(const std::string& format) {
    return format == kFormatPcmS16le || format == kFormatWav;
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 输入校验错误 (1xx)
    VALIDATION_FAILED = 100,
    UNKNOWN_PRESET = 101,
    UNKNOWN_EMOTION = 102,
    PARAMETER_RANGE = 103,
    INVALID_ARGUMENT = 104,
    UNSUPPORTED_FORMAT = 105,
    INVALID_TEXT = 106,
    TEXT_TOO_LONG = 107,

    // 运行时错误 (2xx)
    CHAIN_APPLICATION_FAILED = 200,
    NOT_INITIALIZED = 201,

    // 存储 / 文件错误 (3xx)
    NOT_FOUND = 300,
    ALREADY_EXISTS = 301,
    SECURITY_VIOLATION = 302,
    FORMAT_ERROR = 303,
    STORAGE_ERROR = 304,
    FILE_WRITE_ERROR = 305,

    // 后端错误 (4xx)
    BACKEND_ERROR = 400,
    UNSUPPORTED_ENGINE = 401,

    // 内部错误 (5xx)
    INTERNAL_ERROR = 500,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                       return "OK";
        case ErrorCode::VALIDATION_FAILED:        return "VALIDATION_FAILED";
        case ErrorCode::UNKNOWN_PRESET:           return "UNKNOWN_PRESET";
        case ErrorCode::UNKNOWN_EMOTION:          return "UNKNOWN_EMOTION";
        case ErrorCode::PARAMETER_RANGE:          return "PARAMETER_RANGE";
        case ErrorCode::INVALID_ARGUMENT:         return "INVALID_ARGUMENT";
        case ErrorCode::UNSUPPORTED_FORMAT:       return "UNSUPPORTED_FORMAT";
        case ErrorCode::INVALID_TEXT:             return "INVALID_TEXT";
        case ErrorCode::TEXT_TOO_LONG:            return "TEXT_TOO_LONG";
        case ErrorCode::CHAIN_APPLICATION_FAILED: return "CHAIN_APPLICATION_FAILED";
        case ErrorCode::NOT_INITIALIZED:          return "NOT_INITIALIZED";
        case ErrorCode::NOT_FOUND:                return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS:           return "ALREADY_EXISTS";
        case ErrorCode::SECURITY_VIOLATION:       return "SECURITY_VIOLATION";
        case ErrorCode::FORMAT_ERROR:             return "FORMAT_ERROR";
        case ErrorCode::STORAGE_ERROR:            return "STORAGE_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:         return "FILE_WRITE_ERROR";
        case ErrorCode::BACKEND_ERROR:            return "BACKEND_ERROR";
        case ErrorCode::UNSUPPORTED_ENGINE:       return "UNSUPPORTED_ENGINE";
        case ErrorCode::INTERNAL_ERROR:           return "INTERNAL_ERROR";
        default:                                  return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string detail;                 // 详细信息(调试用)

    // 结构化信息, 供调用方定位并修正输入
    std::vector<std::string> errors;    // 校验失败的全部条目 (VALIDATION_FAILED / PARAMETER_RANGE)
    std::string field;                  // 出错字段 (单字段错误)
    int effect_position = 0;            // 效果链中出错的位置 (从 1 开始, 0 表示无)
    std::string effect_kind;            // 效果链中出错的效果类型

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return ErrorInfo();
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        ErrorInfo info;
        info.code = code;
        info.message = msg;
        info.detail = detail;
        return info;
    }

    /// @brief 多条校验错误, 全部保留
    static ErrorInfo invalid(ErrorCode code, const std::string& msg,
                             const std::vector<std::string>& errors) {
        ErrorInfo info = error(code, msg);
        info.errors = errors;
        for (const auto& e : errors) {
            info.detail += info.detail.empty() ? e : "; " + e;
        }
        return info;
    }

    /// @brief 单字段错误
    static ErrorInfo fieldError(ErrorCode code, const std::string& field, const std::string& msg) {
        ErrorInfo info = error(code, msg);
        info.field = field;
        info.errors.push_back(msg);
        return info;
    }
};

// =============================================================================
// Audio Data (音频数据)
// =============================================================================

struct AudioData {
    std::vector<uint8_t> bytes;                  // 编码后的音频字节
    std::string format = kFormatPcmS16le;        // 格式标识
    int sample_rate = 0;                         // 采样率 (Hz)
    double duration = 0.0;                       // 时长 (秒)
    std::vector<std::string> processing_history; // 已应用的处理步骤 (按顺序)

    bool isEmpty() const { return bytes.empty(); }

    int getDurationMs() const {
        return static_cast<int>(duration * 1000.0);
    }

    bool operator==(const AudioData& other) const {
        return bytes == other.bytes &&
            format == other.format &&
            sample_rate == other.sample_rate &&
            duration == other.duration &&
            processing_history == other.processing_history;
    }

    bool operator!=(const AudioData& other) const {
        return !(*this == other);
    }
};

// =============================================================================
// Text Data (文本数据)
// =============================================================================

struct TextData {
    std::string text;
    float confidence = 1.0f;                     // [0, 1]
    std::string language = "en-US";
    std::map<std::string, std::string> metadata;
};

// =============================================================================
// Validation Report (校验报告)
// =============================================================================

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;

    void add(const std::string& message) {
        valid = false;
        errors.push_back(message);
    }
};

}  // namespace voice

#endif  // VOICE_TYPES_HPP
