#ifndef TEXT_NORMALIZER_HPP
#define TEXT_NORMALIZER_HPP

/**
 * TextNormalizer - 文本规范化
 *
 * 合成前清理输入文本: 合并空白、转小写、去标点 (ASCII 与中文标点)。
 * 按 UTF-8 字符处理, 不会截断多字节字符。
 */

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {
namespace text {

// =============================================================================
// UTF-8 工具
// =============================================================================

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 */
std::vector<std::string> splitUtf8(const std::string& str);

/// @brief UTF-8 字符数
size_t utf8Length(const std::string& str);

/// @brief 是否为合法 UTF-8 (拒绝截断序列、过长编码与代理区)
bool isValidUtf8(const std::string& str);

/**
 * @brief 判断是否为标点符号 (ASCII 或常见中文标点)
 * @param ch UTF-8 编码的单个字符
 */
bool isPunctuation(const std::string& ch);

// =============================================================================
// TextNormalizer
// =============================================================================

struct NormalizeOptions {
    bool remove_punctuation = false;
    bool lowercase = false;
    bool strip_whitespace = true;       ///< 去除首尾空白并把连续空白合并为一个空格
};

class TextNormalizer {
public:
    /**
     * @brief 规范化文本
     * @param input 原始文本
     * @param options 处理选项
     * @param out [out] 结果; metadata 包含 original_length / final_length 与各选项
     * @return INVALID_TEXT (空或只含空白)
     */
    ErrorInfo normalize(const std::string& input,
                        const NormalizeOptions& options,
                        TextData& out) const;
};

}  // namespace text
}  // namespace voice

#endif  // TEXT_NORMALIZER_HPP
