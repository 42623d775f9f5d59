#include "internal/emotion/emotion_table.hpp"

#include <string>
#include <utility>
#include <vector>

namespace voice {

EmotionTable::EmotionTable(std::vector<Entry> emotions)
    : emotions_(std::move(emotions)) {
}

EmotionTable EmotionTable::createBuiltin() {
    //                       pitch   speed   volume  variance
    return EmotionTable({
        {"neutral",   { 0.0f,  1.00f,  1.00f,  1.0f}},
        {"happy",     { 2.0f,  1.10f,  1.05f,  1.3f}},
        {"sad",       {-1.5f,  0.85f,  0.90f,  0.7f}},
        {"angry",     { 1.0f,  1.20f,  1.20f,  1.5f}},
        {"excited",   { 3.0f,  1.30f,  1.10f,  1.6f}},
        {"calm",      { 0.0f,  0.90f,  0.95f,  0.5f}},
        {"fearful",   { 2.5f,  1.15f,  0.85f,  1.4f}},
        {"confident", {-0.5f,  0.95f,  1.10f,  0.8f}},
    });
}

bool EmotionTable::contains(const std::string& emotion) const {
    return find(emotion) != nullptr;
}

const EmotionBaseline* EmotionTable::find(const std::string& emotion) const {
    for (const auto& entry : emotions_) {
        if (entry.first == emotion) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::vector<std::string> EmotionTable::list() const {
    std::vector<std::string> names;
    names.reserve(emotions_.size());
    for (const auto& entry : emotions_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace voice
