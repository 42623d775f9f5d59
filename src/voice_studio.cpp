#include "voice_api.hpp"

#include <cctype>
#include <cstdint>

#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "internal/audio/pcm_codec.hpp"
#include "internal/backends/speech_backend.hpp"
#include "internal/effects/audio_effects.hpp"
#include "internal/engine/voice_customization_engine.hpp"
#include "internal/io/audio_file_io.hpp"
#include "internal/storage/profile_store.hpp"
#include "internal/text/text_normalizer.hpp"
#include "internal/transform/voice_transformer.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace Vox {

namespace {

Status toStatus(const voice::ErrorInfo& error) {
    Status status;
    status.code = voice::errorCodeToString(error.code);
    status.message = error.message;
    status.errors = error.errors;
    status.field = error.field;
    status.effect_position = error.effect_position;
    status.effect_kind = error.effect_kind;
    return status;
}

voice::ErrorInfo toOverrides(const VoiceOverrides& o, voice::ProfileOverrides& overrides) {
    overrides = voice::ProfileOverrides();
    if (o.custom_params) {
        auto params = nlohmann::json::parse(*o.custom_params, nullptr, false);
        if (params.is_discarded() || !params.is_object()) {
            return voice::ErrorInfo::fieldError(voice::ErrorCode::INVALID_ARGUMENT, "custom_params",
                "custom_params: must be a JSON object");
        }
        overrides.custom_params = params;
    }
    overrides.gender = o.gender;
    overrides.pitch = o.pitch;
    overrides.speed = o.speed;
    overrides.volume = o.volume;
    overrides.timbre = o.timbre;
    overrides.language = o.language;
    overrides.accent = o.accent;
    overrides.age_range = o.age_range;
    overrides.emotion_default = o.emotion_default;
    return voice::ErrorInfo::ok();
}

VoiceOverrides fromOverrides(const voice::ProfileOverrides& overrides) {
    VoiceOverrides o;
    o.gender = overrides.gender;
    o.pitch = overrides.pitch;
    o.speed = overrides.speed;
    o.volume = overrides.volume;
    o.timbre = overrides.timbre;
    o.language = overrides.language;
    o.accent = overrides.accent;
    o.age_range = overrides.age_range;
    o.emotion_default = overrides.emotion_default;
    if (overrides.custom_params) {
        o.custom_params = overrides.custom_params->dump(-1, ' ', false,
            nlohmann::json::error_handler_t::replace);
    }
    return o;
}

VoiceInfo toVoiceInfo(const voice::VoiceProfile& profile) {
    VoiceInfo info;
    info.profile_id = profile.profile_id;
    info.name = profile.name;
    info.gender = profile.gender;
    info.pitch = profile.pitch;
    info.speed = profile.speed;
    info.volume = profile.volume;
    info.timbre = profile.timbre;
    info.language = profile.language;
    info.accent = profile.accent;
    info.age_range = profile.age_range;
    info.emotion_default = profile.emotion_default;
    info.custom_params = profile.custom_params.dump(-1, ' ', false,
        nlohmann::json::error_handler_t::replace);
    info.created_at = profile.created_at;
    info.updated_at = profile.updated_at;
    return info;
}

// 转换 Vox::VoiceConfig 到 voice::EngineConfig
voice::EngineConfig convertConfig(const VoiceConfig& cfg) {
    voice::EngineConfig config;
    config.engine = cfg.engine;
    config.language = cfg.language;
    config.voice = cfg.voice;
    config.sample_rate = cfg.sample_rate;
    config.http_endpoint = cfg.http_endpoint;
    config.api_key = cfg.api_key;
    config.http_timeout_ms = cfg.http_timeout_ms;
    config.storage_path = cfg.storage_path;
    config.output_dir = cfg.output_dir;
    return config;
}

bool hasWavExtension(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".wav";
}

}  // namespace

// =============================================================================
// VoiceResult 实现
// =============================================================================

struct VoiceResult::Impl {
    voice::ErrorInfo error;
    voice::AudioData audio;
    std::string text;
    float confidence = 0.0f;
};

VoiceResult::VoiceResult() : impl_(std::make_unique<Impl>()) {}
VoiceResult::~VoiceResult() = default;

VoiceResult::VoiceResult(VoiceResult&&) noexcept = default;
VoiceResult& VoiceResult::operator=(VoiceResult&&) noexcept = default;

bool VoiceResult::IsSuccess() const {
    return impl_->error.isOk();
}

std::string VoiceResult::GetCode() const {
    return voice::errorCodeToString(impl_->error.code);
}

std::string VoiceResult::GetMessage() const {
    return impl_->error.message;
}

std::vector<std::string> VoiceResult::GetErrors() const {
    return impl_->error.errors;
}

int VoiceResult::GetEffectPosition() const {
    return impl_->error.effect_position;
}

std::string VoiceResult::GetEffectKind() const {
    return impl_->error.effect_kind;
}

std::string VoiceResult::GetField() const {
    return impl_->error.field;
}

std::vector<uint8_t> VoiceResult::GetAudioData() const {
    return impl_->audio.bytes;
}

std::string VoiceResult::GetFormat() const {
    return impl_->audio.format;
}

int VoiceResult::GetSampleRate() const {
    return impl_->audio.sample_rate;
}

int VoiceResult::GetDurationMs() const {
    return impl_->audio.getDurationMs();
}

std::vector<std::string> VoiceResult::GetHistory() const {
    return impl_->audio.processing_history;
}

std::string VoiceResult::GetText() const {
    return impl_->text;
}

float VoiceResult::GetConfidence() const {
    return impl_->confidence;
}

bool VoiceResult::SaveToFile(const std::string& file_path) const {
    const auto& audio = impl_->audio;
    if (!IsSuccess() || audio.isEmpty()) {
        return false;
    }

    std::ofstream file(file_path, std::ios::binary);
    if (!file) {
        std::cerr << "[VoiceResult] Cannot open " << file_path << std::endl;
        return false;
    }

    if (audio.format == voice::kFormatPcmS16le && hasWavExtension(file_path)) {
        std::vector<int16_t> pcm(audio.bytes.size() / 2);
        for (size_t i = 0; i < pcm.size(); ++i) {
            pcm[i] = static_cast<int16_t>(audio.bytes[i * 2] | (audio.bytes[i * 2 + 1] << 8));
        }
        auto wav = voice::audio::buildWav(pcm, audio.sample_rate);
        file.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
    } else {
        file.write(reinterpret_cast<const char*>(audio.bytes.data()),
            static_cast<std::streamsize>(audio.bytes.size()));
    }
    return file.good();
}

// =============================================================================
// VoiceStudio 实现
// =============================================================================

struct VoiceStudio::Impl {
    VoiceConfig config;
    voice::EngineConfig engine_config;
    std::unique_ptr<voice::ISpeechBackend> backend;
    std::unique_ptr<voice::VoiceCustomizationEngine> engine;
    std::unique_ptr<voice::AudioFileWriter> writer;
    voice::AudioFileLoader loader;
    voice::text::TextNormalizer normalizer;
    voice::ErrorInfo backend_error;
    bool initialized = false;

    void init(const VoiceConfig& cfg) {
        config = cfg;
        engine_config = convertConfig(cfg);

        // 档案相关功能不依赖后端, 始终可用
        std::shared_ptr<voice::IProfileStore> store;
        if (engine_config.usesMemoryStore()) {
            store = std::make_shared<voice::MemoryProfileStore>();
        } else {
            store = std::make_shared<voice::JsonProfileStore>(engine_config.getExpandedStoragePath());
        }
        engine = std::make_unique<voice::VoiceCustomizationEngine>(store);
        writer = std::make_unique<voice::AudioFileWriter>(engine_config.getExpandedOutputDir());

        backend_error = engine_config.validate();
        if (!backend_error.isOk()) {
            std::cerr << "[VoiceStudio] Invalid config: " << backend_error.message << std::endl;
            return;
        }

        // 创建后端
        backend_error = voice::SpeechBackendFactory::create(engine_config.engine, backend);
        if (!backend_error.isOk()) {
            return;
        }

        // 初始化
        backend_error = backend->initialize(engine_config);
        if (!backend_error.isOk()) {
            std::cerr << "[VoiceStudio] Failed to initialize backend " << engine_config.engine
                      << ": " << backend_error.message << std::endl;
            backend.reset();
            return;
        }

        initialized = true;
        std::cout << "[VoiceStudio] Ready (engine=" << backend->getName()
                  << ", store=" << store->getName() << ")" << std::endl;
    }

    voice::ErrorInfo checkBackend() const {
        if (initialized && backend) {
            return voice::ErrorInfo::ok();
        }
        return voice::ErrorInfo::error(voice::ErrorCode::NOT_INITIALIZED,
            "Engine not initialized", backend_error.message);
    }

    /// @brief 解析效果描述, 出错时记录位置
    voice::ErrorInfo parseEffects(const std::vector<std::string>& descriptors,
                                  std::vector<voice::EffectConfig>& effects) const {
        effects.clear();
        for (size_t i = 0; i < descriptors.size(); ++i) {
            voice::EffectConfig effect;
            auto err = voice::AudioEffects::parseEffect(descriptors[i], effect);
            if (!err.isOk()) {
                err.effect_position = static_cast<int>(i + 1);
                return err;
            }
            effects.push_back(effect);
        }
        return voice::ErrorInfo::ok();
    }

    /// @brief 解析效果, 然后把档案、情绪与效果链应用到音频
    voice::ErrorInfo applyProfile(const voice::AudioData& input,
                                  const voice::VoiceProfile& profile,
                                  const SpeakOptions& options,
                                  voice::AudioData& out) const {
        std::vector<voice::EffectConfig> effects;
        auto err = parseEffects(options.effects, effects);
        if (!err.isOk()) {
            return err;
        }
        return engine->applyVoiceProfile(input, profile, options.emotion,
            options.emotion_intensity, effects, out);
    }
};

VoiceStudio::VoiceStudio(const VoiceConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config);
}

VoiceStudio::~VoiceStudio() {
    if (impl_->backend) {
        impl_->backend->shutdown();
    }
}

std::shared_ptr<VoiceResult> VoiceStudio::makeResult(const voice::ErrorInfo& error,
    const voice::AudioData* audio) {
    auto result = std::make_shared<VoiceResult>();
    result->impl_->error = error;
    if (error.isOk() && audio) {
        result->impl_->audio = *audio;
    }
    if (!error.isOk()) {
        std::cerr << "[VoiceStudio] " << voice::errorCodeToString(error.code)
                  << ": " << error.message << std::endl;
    }
    return result;
}

// -----------------------------------------------------------------------------
// 音色档案
// -----------------------------------------------------------------------------

Status VoiceStudio::CreateVoice(const std::string& name,
    const std::string& base_preset,
    const VoiceOverrides& overrides,
    VoiceInfo& out) {
    voice::ProfileOverrides parsed;
    auto err = toOverrides(overrides, parsed);
    if (!err.isOk()) {
        std::cerr << "[VoiceStudio] " << err.message << std::endl;
        return toStatus(err);
    }
    voice::VoiceProfile profile;
    err = impl_->engine->createCustomVoice(name, base_preset, parsed, profile);
    if (err.isOk()) {
        out = toVoiceInfo(profile);
    }
    return toStatus(err);
}

Status VoiceStudio::UpdateVoice(const std::string& profile_id,
    const VoiceOverrides& overrides,
    VoiceInfo& out) {
    voice::ProfileOverrides parsed;
    auto err = toOverrides(overrides, parsed);
    if (!err.isOk()) {
        std::cerr << "[VoiceStudio] " << err.message << std::endl;
        return toStatus(err);
    }
    voice::VoiceProfile profile;
    err = impl_->engine->updateProfile(profile_id, parsed, profile);
    if (err.isOk()) {
        out = toVoiceInfo(profile);
    }
    return toStatus(err);
}

Status VoiceStudio::GetVoice(const std::string& profile_id, VoiceInfo& out) {
    voice::VoiceProfile profile;
    auto err = impl_->engine->loadSavedProfile(profile_id, profile);
    if (err.isOk()) {
        out = toVoiceInfo(profile);
    }
    return toStatus(err);
}

Status VoiceStudio::ListVoices(std::vector<VoiceInfo>& out) {
    std::vector<voice::ProfileSummary> summaries;
    auto err = impl_->engine->listSavedProfiles(summaries);
    if (!err.isOk()) {
        return toStatus(err);
    }

    out.clear();
    for (const auto& s : summaries) {
        VoiceInfo info;
        info.profile_id = s.profile_id;
        info.name = s.name;
        info.gender = s.gender;
        info.language = s.language;
        info.created_at = s.created_at;
        out.push_back(info);
    }
    return Status();
}

bool VoiceStudio::DeleteVoice(const std::string& profile_id) {
    return impl_->engine->deleteSavedProfile(profile_id);
}

Status VoiceStudio::ParseOverrides(const std::string& json_text, VoiceOverrides& out) {
    auto json = nlohmann::json::parse(json_text, nullptr, false);
    if (json.is_discarded()) {
        return toStatus(voice::ErrorInfo::error(voice::ErrorCode::INVALID_ARGUMENT,
            "Overrides are not valid JSON"));
    }
    voice::ProfileOverrides overrides;
    auto err = voice::ProfileOverrides::fromJson(json, overrides);
    if (err.isOk()) {
        out = fromOverrides(overrides);
    }
    return toStatus(err);
}

// -----------------------------------------------------------------------------
// 音频
// -----------------------------------------------------------------------------

std::shared_ptr<VoiceResult> VoiceStudio::Speak(const std::string& text,
    const std::string& profile_id,
    const SpeakOptions& options) {
    auto err = impl_->checkBackend();
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::VoiceProfile profile;
    err = impl_->engine->loadSavedProfile(profile_id, profile);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::text::NormalizeOptions normalize_options;
    normalize_options.remove_punctuation = options.remove_punctuation;
    normalize_options.lowercase = options.lowercase;
    voice::TextData normalized;
    err = impl_->normalizer.normalize(text, normalize_options, normalized);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    // 档案的语速在韵律阶段应用, 后端按原速合成
    voice::SynthesisRequest request;
    request.text = normalized.text;
    request.voice = impl_->engine_config.voice;
    request.language = profile.language;

    voice::AudioData synthesized;
    err = impl_->backend->synthesize(request, synthesized);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::AudioData out;
    err = impl_->applyProfile(synthesized, profile, options, out);
    return makeResult(err, &out);
}

std::shared_ptr<VoiceResult> VoiceStudio::Process(const std::string& input_path,
    const std::string& profile_id,
    const SpeakOptions& options) {
    voice::VoiceProfile profile;
    auto err = impl_->engine->loadSavedProfile(profile_id, profile);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::AudioData input;
    err = impl_->loader.load(input_path, input);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::AudioData out;
    err = impl_->applyProfile(input, profile, options, out);
    return makeResult(err, &out);
}

std::shared_ptr<VoiceResult> VoiceStudio::Transform(const std::string& input_path,
    const std::string& transform_preset) {
    voice::VoiceTransform transform;
    if (!voice::VoiceTransform::fromPreset(transform_preset, transform)) {
        auto err = voice::ErrorInfo::fieldError(voice::ErrorCode::UNKNOWN_PRESET, "transform",
            "Unknown voice transform: " + transform_preset);
        return makeResult(err, nullptr);
    }

    voice::AudioData input;
    auto err = impl_->loader.load(input_path, input);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::AudioData out;
    err = impl_->engine->getTransformer().transformVoice(input, transform, out);
    return makeResult(err, &out);
}

std::shared_ptr<VoiceResult> VoiceStudio::Transcribe(const std::string& input_path,
    const std::string& language) {
    auto err = impl_->checkBackend();
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::AudioData input;
    err = impl_->loader.load(input_path, input);
    if (!err.isOk()) {
        return makeResult(err, nullptr);
    }

    voice::RecognitionResult recognition;
    err = impl_->backend->recognize(input,
        language.empty() ? impl_->engine_config.language : language, recognition);
    auto result = makeResult(err, nullptr);
    if (err.isOk()) {
        result->impl_->text = recognition.text;
        result->impl_->confidence = recognition.confidence;
    }
    return result;
}

Status VoiceStudio::Export(const VoiceResult& result,
    const std::string& relative_path,
    bool overwrite,
    std::string& written_path) {
    if (!result.IsSuccess() || result.impl_->audio.isEmpty()) {
        return toStatus(voice::ErrorInfo::error(voice::ErrorCode::INVALID_ARGUMENT,
            "Result contains no audio"));
    }

    voice::WriteResult written;
    auto err = impl_->writer->write(result.impl_->audio, relative_path, overwrite, written);
    if (err.isOk()) {
        written_path = written.file_path;
    }
    return toStatus(err);
}

// -----------------------------------------------------------------------------
// 查询
// -----------------------------------------------------------------------------

std::vector<std::string> VoiceStudio::ListPresets() const {
    return impl_->engine->getPresetList();
}

std::vector<std::string> VoiceStudio::ListEmotions() const {
    return impl_->engine->getEmotionList();
}

std::vector<std::string> VoiceStudio::ListEffects() const {
    static const voice::EffectKind kinds[] = {
        voice::EffectKind::REVERB,
        voice::EffectKind::ECHO,
        voice::EffectKind::EQUALIZER,
        voice::EffectKind::CHORUS,
        voice::EffectKind::COMPRESSOR,
        voice::EffectKind::DISTORTION,
        voice::EffectKind::NOISE_GATE,
        voice::EffectKind::PITCH_SHIFT,
        voice::EffectKind::TIME_STRETCH,
    };
    std::vector<std::string> names;
    for (auto kind : kinds) {
        names.push_back(voice::effectKindToString(kind));
    }
    return names;
}

std::vector<std::string> VoiceStudio::ListTransforms() const {
    return voice::VoiceTransform::presetNames();
}

std::vector<std::string> VoiceStudio::ListEngines() {
    return voice::SpeechBackendFactory::getAvailableBackends();
}

VoiceConfig VoiceStudio::GetConfig() const {
    return impl_->config;
}

bool VoiceStudio::IsInitialized() const {
    return impl_->initialized;
}

std::string VoiceStudio::GetEngineName() const {
    if (impl_->backend) {
        return impl_->backend->getName();
    }
    return "Unknown";
}

}  // namespace Vox
