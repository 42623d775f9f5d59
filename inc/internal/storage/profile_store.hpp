#ifndef PROFILE_STORE_HPP
#define PROFILE_STORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/profile/voice_profile.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Profile Summary (档案摘要)
// =============================================================================

struct ProfileSummary {
    std::string profile_id;
    std::string name;
    std::string gender;
    std::string language;
    std::string created_at;
};

// =============================================================================
// Profile Store Interface (档案存储抽象接口)
// =============================================================================
//
// 以 profile_id 为键的持久化存储。保存后再读取必须得到相等的档案。
// 实现需保证并发调用安全; 同一 ID 的并发保存以最后一次为准。
//
// 已实现的存储:
// - JsonProfileStore:   每个档案一个 JSON 文件
// - MemoryProfileStore: 进程内存储 (测试 / 临时会话)
//

class IProfileStore {
public:
    virtual ~IProfileStore() = default;

    /// @brief 获取存储名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 保存档案 (非法档案拒绝保存)
    /// @param profile 档案
    /// @param location [out] 存储位置 (文件路径或内存键)
    /// @return VALIDATION_FAILED / STORAGE_ERROR
    virtual ErrorInfo saveProfile(const VoiceProfile& profile, std::string& location) = 0;

    /// @brief 读取档案
    /// @return NOT_FOUND / FORMAT_ERROR
    virtual ErrorInfo loadProfile(const std::string& profile_id, VoiceProfile& profile) = 0;

    /// @brief 列出全部档案, 按 (created_at, profile_id) 排序
    virtual ErrorInfo listProfiles(std::vector<ProfileSummary>& summaries) = 0;

    /// @brief 删除档案
    /// @return 档案存在并已删除时返回 true
    virtual bool deleteProfile(const std::string& profile_id) = 0;

    /// @brief 检查档案是否存在
    virtual bool contains(const std::string& profile_id) = 0;
};

/// @brief 生成档案摘要
ProfileSummary summarize(const VoiceProfile& profile);

/// @brief 按 (created_at, profile_id) 排序
void sortSummaries(std::vector<ProfileSummary>& summaries);

// =============================================================================
// JsonProfileStore
// =============================================================================

class JsonProfileStore : public IProfileStore {
public:
    /// @param storage_dir 存储目录 (不存在时在首次保存时创建)
    explicit JsonProfileStore(const std::string& storage_dir);

    std::string getName() const override { return "JsonProfileStore"; }

    ErrorInfo saveProfile(const VoiceProfile& profile, std::string& location) override;
    ErrorInfo loadProfile(const std::string& profile_id, VoiceProfile& profile) override;
    ErrorInfo listProfiles(std::vector<ProfileSummary>& summaries) override;
    bool deleteProfile(const std::string& profile_id) override;
    bool contains(const std::string& profile_id) override;

    const std::string& getStorageDir() const { return storage_dir_; }

    /// @brief 档案文件名: "{profile_id}_{name}.json", name 中的非法字符替换为 '_'
    static std::string fileNameFor(const VoiceProfile& profile);

private:
    /// @brief 查找 ID 对应的全部文件 (改名后可能残留旧文件)
    std::vector<std::string> findFiles(const std::string& profile_id) const;

    std::string storage_dir_;
    mutable std::mutex mutex_;
};

// =============================================================================
// MemoryProfileStore
// =============================================================================

class MemoryProfileStore : public IProfileStore {
public:
    std::string getName() const override { return "MemoryProfileStore"; }

    ErrorInfo saveProfile(const VoiceProfile& profile, std::string& location) override;
    ErrorInfo loadProfile(const std::string& profile_id, VoiceProfile& profile) override;
    ErrorInfo listProfiles(std::vector<ProfileSummary>& summaries) override;
    bool deleteProfile(const std::string& profile_id) override;
    bool contains(const std::string& profile_id) override;

    size_t size() const;

private:
    std::map<std::string, VoiceProfile> profiles_;
    mutable std::mutex mutex_;
};

}  // namespace voice

#endif  // PROFILE_STORE_HPP
