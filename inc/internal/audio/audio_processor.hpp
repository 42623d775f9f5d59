#ifndef AUDIO_PROCESSOR_HPP
#define AUDIO_PROCESSOR_HPP

/**
 * AudioProcessor - 采样级音频处理
 *
 * 提供增益、动态压缩、重采样、时间伸缩、变调、音色倾斜等基础处理,
 * 供效果链与音色变换使用。全部为纯函数, 输入不被修改。
 */

#include <cstdint>

#include <vector>

namespace voice {
namespace audio {

// =============================================================================
// 电平
// =============================================================================

/**
 * @brief 计算音频的 RMS (Root Mean Square)
 * @param audio 音频样本
 * @return RMS 值
 */
float calculateRMS(const std::vector<float>& audio);

/**
 * @brief 分贝转线性幅度
 * @param db 分贝值
 * @return 线性幅度
 */
float dbToLinear(float db);

/**
 * @brief 应用增益
 * @param audio 输入音频
 * @param gain 线性增益 (>= 0)
 * @return 处理后的音频
 */
std::vector<float> applyGain(const std::vector<float>& audio, float gain);

/**
 * @brief 应用动态压缩
 * @param audio 输入音频
 * @param threshold 压缩阈值 (线性幅度)
 * @param ratio 压缩比 (>= 1)
 * @return 压缩后的音频
 */
std::vector<float> applyCompression(const std::vector<float>& audio,
                                    float threshold,
                                    float ratio);

// =============================================================================
// 时间 / 音高
// =============================================================================

/**
 * @brief 按比例重采样 (线性插值)
 * @param audio 输入音频
 * @param ratio 输出长度 / 输入长度
 * @return 重采样后的音频
 */
std::vector<float> resampleByRatio(const std::vector<float>& audio, double ratio);

/**
 * @brief 重采样音频 (线性插值)
 * @param audio 输入音频
 * @param src_rate 源采样率
 * @param dst_rate 目标采样率
 * @return 重采样后的音频
 */
std::vector<float> resampleAudio(const std::vector<float>& audio,
                                 int src_rate,
                                 int dst_rate);

/// 时间伸缩 / 重采样允许的速率范围, 超出范围的速率会被截断
constexpr double kMinStretchRate = 0.01;
constexpr double kMaxStretchRate = 100.0;

/**
 * @brief 时间伸缩 (重叠相加, 音高不变)
 * @param audio 输入音频
 * @param rate 播放速率 (>1.0 变短, <1.0 变长), 截断到 [kMinStretchRate, kMaxStretchRate]
 * @param sample_rate 采样率
 * @return 长度约为 audio.size() / rate 的音频
 */
std::vector<float> timeStretch(const std::vector<float>& audio,
                               double rate,
                               int sample_rate);

/**
 * @brief 变调 (时长不变)
 * @param audio 输入音频
 * @param semitones 半音数
 * @param sample_rate 采样率
 * @return 与输入等长的音频
 */
std::vector<float> pitchShift(const std::vector<float>& audio,
                              float semitones,
                              int sample_rate);

// =============================================================================
// 滤波 / 音色
// =============================================================================

/**
 * @brief 一阶低通滤波
 * @param audio 输入音频
 * @param cutoff_hz 截止频率
 * @param sample_rate 采样率
 * @return 滤波后的音频
 */
std::vector<float> lowPass(const std::vector<float>& audio,
                           float cutoff_hz,
                           int sample_rate);

/**
 * @brief 频谱倾斜: amount > 0 提亮, amount < 0 变暗
 * @param audio 输入音频
 * @param amount 倾斜量 [-1, 1]
 * @param sample_rate 采样率
 * @return 处理后的音频
 */
std::vector<float> spectralTilt(const std::vector<float>& audio,
                                float amount,
                                int sample_rate);

/**
 * @brief 叠加随包络变化的噪声 (固定种子, 结果确定)
 * @param audio 输入音频
 * @param level 噪声比例 [0, 1]
 * @param seed 随机种子
 * @return 处理后的音频
 */
std::vector<float> addEnvelopeNoise(const std::vector<float>& audio,
                                    float level,
                                    uint32_t seed);

/**
 * @brief 幅度调制
 * @param audio 输入音频
 * @param depth 调制深度 [0, 1]
 * @param rate_hz 调制频率
 * @param sample_rate 采样率
 * @return 处理后的音频
 */
std::vector<float> amplitudeModulate(const std::vector<float>& audio,
                                     float depth,
                                     float rate_hz,
                                     int sample_rate);

// =============================================================================
// 格式转换
// =============================================================================

/**
 * @brief float 转 int16
 * @param audio float 音频 [-1.0, 1.0]
 * @return int16 音频
 */
std::vector<int16_t> floatToInt16(const std::vector<float>& audio);

/**
 * @brief int16 转 float
 * @param audio int16 音频
 * @return float 音频 [-1.0, 1.0]
 */
std::vector<float> int16ToFloat(const std::vector<int16_t>& audio);

}  // namespace audio
}  // namespace voice

#endif  // AUDIO_PROCESSOR_HPP
