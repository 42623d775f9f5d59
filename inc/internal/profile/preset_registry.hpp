#ifndef PRESET_REGISTRY_HPP
#define PRESET_REGISTRY_HPP

#include <string>
#include <utility>
#include <vector>

#include "internal/profile/voice_profile.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// PresetRegistry - 预设音色表
// =============================================================================
//
// 只读的预设表, 创建后不可修改, 由调用方注入到引擎。
// 预设只提供字段集合: profile_id / name / 时间戳在创建档案时重新生成。
//

class PresetRegistry {
public:
    using Entry = std::pair<std::string, VoiceProfile>;

    explicit PresetRegistry(std::vector<Entry> presets);

    /// @brief 内置的 6 个预设
    static PresetRegistry createBuiltin();

    bool contains(const std::string& name) const;

    /// @brief 查找预设
    /// @param name 预设名称
    /// @param out [out] 预设字段集合
    /// @return UNKNOWN_PRESET 表示不存在
    ErrorInfo get(const std::string& name, VoiceProfile& out) const;

    /// @brief 预设名称 (按注册顺序)
    std::vector<std::string> list() const;

    size_t size() const { return presets_.size(); }

private:
    const std::vector<Entry> presets_;
};

}  // namespace voice

#endif  // PRESET_REGISTRY_HPP
