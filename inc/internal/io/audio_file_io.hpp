#ifndef AUDIO_FILE_IO_HPP
#define AUDIO_FILE_IO_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// AudioFileLoader - 音频文件读取
// =============================================================================

class AudioFileLoader {
public:
    /// @brief 支持的扩展名 (wav, mp3, flac, ogg, m4a)
    static const std::vector<std::string>& supportedFormats();

    /**
     * @brief 读取音频文件
     * @param file_path 文件路径
     * @param expected_format 期望的格式 (为空则不检查)
     * @param audio [out] 音频数据; wav 读取真实采样率与时长,
     *              其他格式采样率记为 44100, 时长按文件大小估算
     * @return NOT_FOUND / FORMAT_ERROR / STORAGE_ERROR
     */
    ErrorInfo load(const std::string& file_path,
                   const std::string& expected_format,
                   AudioData& audio) const;

    ErrorInfo load(const std::string& file_path, AudioData& audio) const {
        return load(file_path, "", audio);
    }
};

// =============================================================================
// AudioFileWriter - 音频文件写入
// =============================================================================

struct WriteResult {
    std::string file_path;          ///< 实际写入的绝对路径
    uintmax_t file_size = 0;        ///< 字节数
};

class AudioFileWriter {
public:
    /// @param base_dir 输出根目录, 所有写入都限制在其内部
    explicit AudioFileWriter(const std::string& base_dir);

    /// @brief 允许的扩展名 (wav, mp3, flac, ogg)
    static const std::vector<std::string>& allowedExtensions();

    /**
     * @brief 写入音频文件
     * @param audio 音频数据 (pcm_s16le 写入 .wav 时自动加 RIFF 头)
     * @param file_path 相对 base_dir 的路径
     * @param overwrite 是否允许覆盖已有文件
     * @param result [out] 写入结果
     * @return SECURITY_VIOLATION / FORMAT_ERROR / ALREADY_EXISTS / FILE_WRITE_ERROR
     */
    ErrorInfo write(const AudioData& audio,
                    const std::string& file_path,
                    bool overwrite,
                    WriteResult& result) const;

    const std::string& getBaseDir() const { return base_dir_; }

private:
    std::string base_dir_;
};

}  // namespace voice

#endif  // AUDIO_FILE_IO_HPP
