#include "internal/storage/profile_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxNameInFileName = 48;

// ID 只能是单个文件名片段, 不能借此访问存储目录之外;
// '_' 是文件名中 ID 与名称的分隔符, 也不允许出现
bool isSafeId(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    for (unsigned char c : id) {
        if (!(std::isalnum(c) || c == '-' || c == '.')) return false;
    }
    return true;
}

ErrorInfo rejectInvalid(const VoiceProfile& profile, const char* store) {
    auto report = profile.validate();
    if (report.valid) {
        return ErrorInfo::ok();
    }
    std::cerr << "[" << store << "] Refusing to save invalid profile '" << profile.name
              << "': " << report.errors.front() << std::endl;
    return ErrorInfo::invalid(ErrorCode::VALIDATION_FAILED,
        "Invalid profile: " + profile.name, report.errors);
}

ErrorInfo notFound(const std::string& profile_id) {
    return ErrorInfo::error(ErrorCode::NOT_FOUND, "Profile not found: " + profile_id);
}

}  // namespace

ProfileSummary summarize(const VoiceProfile& profile) {
    ProfileSummary summary;
    summary.profile_id = profile.profile_id;
    summary.name = profile.name;
    summary.gender = profile.gender;
    summary.language = profile.language;
    summary.created_at = profile.created_at;
    return summary;
}

void sortSummaries(std::vector<ProfileSummary>& summaries) {
    std::sort(summaries.begin(), summaries.end(),
        [](const ProfileSummary& a, const ProfileSummary& b) {
            return std::tie(a.created_at, a.profile_id) < std::tie(b.created_at, b.profile_id);
        });
}

// =============================================================================
// JsonProfileStore
// =============================================================================

JsonProfileStore::JsonProfileStore(const std::string& storage_dir)
    : storage_dir_(storage_dir) {}

std::string JsonProfileStore::fileNameFor(const VoiceProfile& profile) {
    std::string safe_name;
    for (unsigned char c : profile.name) {
        if (safe_name.size() >= kMaxNameInFileName) break;
        safe_name += (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    }
    return profile.profile_id + "_" + safe_name + ".json";
}

std::vector<std::string> JsonProfileStore::findFiles(const std::string& profile_id) const {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(storage_dir_, ec)) {
        return files;
    }

    std::string prefix = profile_id + "_";
    for (const auto& entry : fs::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0 &&
            entry.path().extension() == ".json") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

ErrorInfo JsonProfileStore::saveProfile(const VoiceProfile& profile, std::string& location) {
    auto err = rejectInvalid(profile, "JsonProfileStore");
    if (!err.isOk()) {
        return err;
    }
    if (!isSafeId(profile.profile_id)) {
        return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, "profile_id",
            "Invalid profile id: '" + profile.profile_id + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(storage_dir_, ec);
    if (ec) {
        std::cerr << "[JsonProfileStore] Failed to create storage directory: "
                  << storage_dir_ << " (" << ec.message() << ")" << std::endl;
        return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
            "Failed to create storage directory", storage_dir_ + ": " + ec.message());
    }

    fs::path target = fs::path(storage_dir_) / fileNameFor(profile);
    fs::path temp = target;
    temp += ".tmp";

    // custom_params 中的非法 UTF-8 以 U+FFFD 写出, 不抛异常
    std::string content = profileToJson(profile).dump(2, ' ', false,
        nlohmann::json::error_handler_t::replace);

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            std::cerr << "[JsonProfileStore] Failed to open file for writing: " << temp << std::endl;
            return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
                "Failed to open profile file for writing", temp.string());
        }
        file << content;
        file.close();
        if (!file) {
            std::cerr << "[JsonProfileStore] Failed to write " << temp << std::endl;
            fs::remove(temp, ec);
            return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
                "Failed to write profile file", temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
            "Failed to commit profile file", target.string());
    }

    // 改名后旧文件名不同, 清理残留
    for (const auto& path : findFiles(profile.profile_id)) {
        if (fs::path(path) != target) {
            fs::remove(path, ec);
        }
    }

    location = target.string();
    std::cout << "[JsonProfileStore] Saved profile " << profile.profile_id
              << " -> " << location << std::endl;
    return ErrorInfo::ok();
}

ErrorInfo JsonProfileStore::loadProfile(const std::string& profile_id, VoiceProfile& profile) {
    if (!isSafeId(profile_id)) {
        return notFound(profile_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto files = findFiles(profile_id);
    if (files.empty()) {
        return notFound(profile_id);
    }

    std::ifstream file(files.front(), std::ios::binary);
    if (!file) {
        return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
            "Failed to open profile file", files.front());
    }

    nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded()) {
        std::cerr << "[JsonProfileStore] Corrupt profile file: " << files.front() << std::endl;
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
            "Profile file is not valid JSON", files.front());
    }

    VoiceProfile loaded;
    auto err = profileFromJson(json, loaded);
    if (!err.isOk()) {
        return err;
    }
    if (loaded.profile_id != profile_id) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
            "Profile file does not match requested id", files.front());
    }

    profile = loaded;
    return ErrorInfo::ok();
}

ErrorInfo JsonProfileStore::listProfiles(std::vector<ProfileSummary>& summaries) {
    std::lock_guard<std::mutex> lock(mutex_);

    summaries.clear();
    std::error_code ec;
    if (!fs::is_directory(storage_dir_, ec)) {
        return ErrorInfo::ok();
    }

    for (const auto& entry : fs::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") continue;

        std::ifstream file(entry.path(), std::ios::binary);
        nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
        VoiceProfile profile;
        if (json.is_discarded() || !profileFromJson(json, profile).isOk()) {
            std::cerr << "[JsonProfileStore] Skipping unreadable file: " << entry.path() << std::endl;
            continue;
        }
        summaries.push_back(summarize(profile));
    }

    sortSummaries(summaries);
    return ErrorInfo::ok();
}

bool JsonProfileStore::deleteProfile(const std::string& profile_id) {
    if (!isSafeId(profile_id)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    bool removed = false;
    std::error_code ec;
    for (const auto& path : findFiles(profile_id)) {
        if (fs::remove(path, ec)) {
            removed = true;
        }
    }
    if (removed) {
        std::cout << "[JsonProfileStore] Deleted profile " << profile_id << std::endl;
    }
    return removed;
}

bool JsonProfileStore::contains(const std::string& profile_id) {
    if (!isSafeId(profile_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !findFiles(profile_id).empty();
}

// =============================================================================
// MemoryProfileStore
// =============================================================================

ErrorInfo MemoryProfileStore::saveProfile(const VoiceProfile& profile, std::string& location) {
    auto err = rejectInvalid(profile, "MemoryProfileStore");
    if (!err.isOk()) {
        return err;
    }
    if (profile.profile_id.empty()) {
        return ErrorInfo::fieldError(ErrorCode::INVALID_ARGUMENT, "profile_id", "Profile id is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[profile.profile_id] = profile;
    location = "memory://" + profile.profile_id;
    return ErrorInfo::ok();
}

ErrorInfo MemoryProfileStore::loadProfile(const std::string& profile_id, VoiceProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(profile_id);
    if (it == profiles_.end()) {
        return notFound(profile_id);
    }
    profile = it->second;
    return ErrorInfo::ok();
}

ErrorInfo MemoryProfileStore::listProfiles(std::vector<ProfileSummary>& summaries) {
    std::lock_guard<std::mutex> lock(mutex_);
    summaries.clear();
    for (const auto& [id, profile] : profiles_) {
        summaries.push_back(summarize(profile));
    }
    sortSummaries(summaries);
    return ErrorInfo::ok();
}

bool MemoryProfileStore::deleteProfile(const std::string& profile_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.erase(profile_id) > 0;
}

bool MemoryProfileStore::contains(const std::string& profile_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.count(profile_id) > 0;
}

size_t MemoryProfileStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

}  // namespace voice
