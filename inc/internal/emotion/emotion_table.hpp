#ifndef EMOTION_TABLE_HPP
#define EMOTION_TABLE_HPP

#include <string>
#include <utility>
#include <vector>

namespace voice {

// =============================================================================
// EmotionBaseline - 情绪基准值 (强度 1.0 时的完整效果)
// =============================================================================

struct EmotionBaseline {
    float pitch_delta = 0.0f;           ///< 音高偏移 (半音, 加性)
    float speed_multiplier = 1.0f;      ///< 语速倍率 (乘性)
    float volume_multiplier = 1.0f;     ///< 音量倍率 (乘性)
    float pitch_variance = 1.0f;        ///< 音高起伏倍率 (乘性)
};

// =============================================================================
// EmotionTable - 情绪表
// =============================================================================
//
// 只读, 创建后不可修改, 由调用方注入到 EmotionEngine。
//

class EmotionTable {
public:
    using Entry = std::pair<std::string, EmotionBaseline>;

    explicit EmotionTable(std::vector<Entry> emotions);

    /// @brief 内置的 8 种情绪 (neutral 为恒等)
    static EmotionTable createBuiltin();

    bool contains(const std::string& emotion) const;

    /// @brief 查找情绪基准值
    /// @return 不存在时返回 nullptr
    const EmotionBaseline* find(const std::string& emotion) const;

    /// @brief 情绪名称 (按注册顺序)
    std::vector<std::string> list() const;

private:
    const std::vector<Entry> emotions_;
};

}  // namespace voice

#endif  // EMOTION_TABLE_HPP
