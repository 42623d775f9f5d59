#include "internal/text/text_normalizer.hpp"

#include <cctype>
#include <cstdint>

#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace voice {
namespace text {

// =============================================================================
// UTF-8 工具
// =============================================================================

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        int char_len = 1;
        unsigned char c = str[i];

        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;
        }

        // 截断的多字节序列直接丢弃
        if (i + char_len <= str.length()) {
            result.push_back(str.substr(i, char_len));
        }
        i += char_len;
    }
    return result;
}

bool isValidUtf8(const std::string& str) {
    size_t i = 0;
    while (i < str.length()) {
        unsigned char c = str[i];
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > str.length()) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = str[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        static const uint32_t kMinCodePoint[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < kMinCodePoint[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

size_t utf8Length(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool isPunctuation(const std::string& ch) {
    if (ch.length() == 1) {
        return std::ispunct(static_cast<unsigned char>(ch[0])) != 0;
    }
    static const std::unordered_set<std::string> cjk_puncts = {
        "，", "。", "！", "？", "：", "；", "、", "“", "”", "‘", "’",
        "—", "–", "…", "（", "）", "【", "】", "《", "》", "「", "」", "·",
    };
    return cjk_puncts.count(ch) > 0;
}

// =============================================================================
// TextNormalizer
// =============================================================================

ErrorInfo TextNormalizer::normalize(const std::string& input,
    const NormalizeOptions& options,
    TextData& out) const {
    bool blank = true;
    for (unsigned char c : input) {
        if (!std::isspace(c)) {
            blank = false;
            break;
        }
    }
    if (blank) {
        std::cerr << "[TextNormalizer] Empty or whitespace-only text" << std::endl;
        return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Empty or whitespace-only text");
    }
    if (!isValidUtf8(input)) {
        std::cerr << "[TextNormalizer] Text is not valid UTF-8" << std::endl;
        return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Text is not valid UTF-8");
    }

    std::string normalized;
    normalized.reserve(input.size());

    bool pending_space = false;
    for (const auto& ch : splitUtf8(input)) {
        bool is_space = ch.length() == 1 && std::isspace(static_cast<unsigned char>(ch[0]));

        if (options.strip_whitespace && is_space) {
            pending_space = true;
            continue;
        }
        if (options.remove_punctuation && isPunctuation(ch)) {
            continue;
        }
        if (pending_space && !normalized.empty()) {
            normalized += ' ';
        }
        pending_space = false;

        if (options.lowercase && ch.length() == 1) {
            normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(ch[0])));
        } else {
            normalized += ch;
        }
    }

    TextData result;
    result.text = normalized;
    result.confidence = 1.0f;
    result.metadata["original_length"] = std::to_string(utf8Length(input));
    result.metadata["final_length"] = std::to_string(utf8Length(normalized));
    result.metadata["lowercase"] = options.lowercase ? "true" : "false";
    result.metadata["remove_punctuation"] = options.remove_punctuation ? "true" : "false";
    result.metadata["strip_whitespace"] = options.strip_whitespace ? "true" : "false";

    out = result;
    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace voice
