#ifndef PCM_CODEC_HPP
#define PCM_CODEC_HPP

/**
 * PcmCodec - PCM / WAV 编解码
 *
 * AudioData 的字节缓冲对核心是不透明的, 只有在需要做采样级处理时
 * 才经由此处解码为 float 采样, 处理完毕后按原格式重新编码。
 * 支持: pcm_s16le (裸数据), wav (PCM 16-bit 单声道)。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {
namespace audio {

struct WavInfo {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    size_t data_offset = 0;         ///< data 块在字节流中的起始位置
    size_t data_size = 0;           ///< data 块字节数
};

/**
 * @brief 解析 WAV 头
 * @param bytes WAV 文件内容
 * @param info [out] 解析结果
 * @return FORMAT_ERROR 表示不是合法的 PCM WAV
 */
ErrorInfo parseWavHeader(const std::vector<uint8_t>& bytes, WavInfo& info);

/**
 * @brief 构造 WAV 文件 (PCM 16-bit 单声道)
 * @param pcm int16 采样
 * @param sample_rate 采样率
 * @return 完整的 WAV 字节流
 */
std::vector<uint8_t> buildWav(const std::vector<int16_t>& pcm, int sample_rate);

/**
 * @brief 将 AudioData 解码为 float 采样
 * @param audio 输入音频 (pcm_s16le 或 wav)
 * @param samples [out] float 采样 [-1.0, 1.0]
 * @return UNSUPPORTED_FORMAT / FORMAT_ERROR
 */
ErrorInfo decodeSamples(const AudioData& audio, std::vector<float>& samples);

/**
 * @brief 解码采样并确定采样率 (wav 取文件头, pcm_s16le 取 audio.sample_rate)
 * @param audio 输入音频
 * @param samples [out] float 采样
 * @param sample_rate [out] 采样率
 * @return INVALID_ARGUMENT (采样率缺失) / UNSUPPORTED_FORMAT / FORMAT_ERROR
 */
ErrorInfo decodeAudio(const AudioData& audio, std::vector<float>& samples, int& sample_rate);

/**
 * @brief 将 float 采样编码为 AudioData
 * @param samples float 采样
 * @param sample_rate 采样率
 * @param format 目标格式 (pcm_s16le 或 wav)
 * @param out [out] 编码结果 (bytes / format / sample_rate / duration)
 * @return UNSUPPORTED_FORMAT
 */
ErrorInfo encodeSamples(const std::vector<float>& samples,
                        int sample_rate,
                        const std::string& format,
                        AudioData& out);

}  // namespace audio
}  // namespace voice

#endif  // PCM_CODEC_HPP
