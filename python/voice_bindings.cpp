#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "voice_api.hpp"

namespace py = pybind11;

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_vox_studio, m) {
    m.doc() = "VoxStudio - Voice Customization Engine Python bindings";

    // =========================================================================
    // VoiceConfig - 配置结构
    // =========================================================================

    py::class_<Vox::VoiceConfig>(m, "VoiceConfig", "Voice engine configuration")
        .def(py::init<>(), "Create default configuration")

        .def_readwrite("engine", &Vox::VoiceConfig::engine, "Speech backend name (tone / http)")
        .def_readwrite("language", &Vox::VoiceConfig::language, "Default language")
        .def_readwrite("voice", &Vox::VoiceConfig::voice, "Backend voice name")
        .def_readwrite("sample_rate", &Vox::VoiceConfig::sample_rate, "Synthesis sample rate (Hz)")
        .def_readwrite("http_endpoint", &Vox::VoiceConfig::http_endpoint, "HTTP service endpoint")
        .def_readwrite("api_key", &Vox::VoiceConfig::api_key, "Bearer token")
        .def_readwrite("http_timeout_ms", &Vox::VoiceConfig::http_timeout_ms, "HTTP timeout (ms)")
        .def_readwrite("storage_path", &Vox::VoiceConfig::storage_path,
            "Profile directory (empty for in-memory store)")
        .def_readwrite("output_dir", &Vox::VoiceConfig::output_dir, "Export root directory")

        // 静态工厂方法
        .def_static("Default", &Vox::VoiceConfig::Default,
                    "Create default configuration (tone backend, JSON store)")
        .def_static("InMemory", &Vox::VoiceConfig::InMemory,
                    "Create configuration with an in-memory profile store")
        .def_static("Http", &Vox::VoiceConfig::Http,
                    py::arg("endpoint"),
                    "Create configuration for a remote speech service")

        // Builder 方法（链式调用）
        .def("withEngine", &Vox::VoiceConfig::withEngine, py::arg("name"))
        .def("withLanguage", &Vox::VoiceConfig::withLanguage, py::arg("lang"))
        .def("withSampleRate", &Vox::VoiceConfig::withSampleRate, py::arg("rate"))
        .def("withStoragePath", &Vox::VoiceConfig::withStoragePath, py::arg("path"))
        .def("withOutputDir", &Vox::VoiceConfig::withOutputDir, py::arg("dir"))
        .def("withApiKey", &Vox::VoiceConfig::withApiKey, py::arg("key"))

        .def("__repr__", [](const Vox::VoiceConfig& config) {
            return "<VoiceConfig engine='" + config.engine + "'" +
                " sample_rate=" + std::to_string(config.sample_rate) +
                " storage='" + config.storage_path + "'>";
        });

    // =========================================================================
    // Status / VoiceInfo / VoiceOverrides / SpeakOptions
    // =========================================================================

    py::class_<Vox::Status>(m, "Status", "Operation status")
        .def(py::init<>())
        .def_readonly("code", &Vox::Status::code)
        .def_readonly("message", &Vox::Status::message)
        .def_readonly("errors", &Vox::Status::errors)
        .def_readonly("field", &Vox::Status::field)
        .def_readonly("effect_position", &Vox::Status::effect_position)
        .def_readonly("effect_kind", &Vox::Status::effect_kind)
        .def("is_success", &Vox::Status::IsSuccess)
        .def("__bool__", &Vox::Status::IsSuccess)
        .def("__repr__", [](const Vox::Status& s) {
            return "<Status " + s.code + (s.message.empty() ? "" : " '" + s.message + "'") + ">";
        });

    py::class_<Vox::VoiceInfo>(m, "VoiceInfo", "Saved voice profile")
        .def(py::init<>())
        .def_readonly("profile_id", &Vox::VoiceInfo::profile_id)
        .def_readonly("name", &Vox::VoiceInfo::name)
        .def_readonly("gender", &Vox::VoiceInfo::gender)
        .def_readonly("pitch", &Vox::VoiceInfo::pitch)
        .def_readonly("speed", &Vox::VoiceInfo::speed)
        .def_readonly("volume", &Vox::VoiceInfo::volume)
        .def_readonly("timbre", &Vox::VoiceInfo::timbre)
        .def_readonly("language", &Vox::VoiceInfo::language)
        .def_readonly("accent", &Vox::VoiceInfo::accent)
        .def_readonly("age_range", &Vox::VoiceInfo::age_range)
        .def_readonly("emotion_default", &Vox::VoiceInfo::emotion_default)
        .def_readonly("custom_params", &Vox::VoiceInfo::custom_params, "JSON text")
        .def_readonly("created_at", &Vox::VoiceInfo::created_at)
        .def_readonly("updated_at", &Vox::VoiceInfo::updated_at)
        .def("__repr__", [](const Vox::VoiceInfo& v) {
            return "<VoiceInfo " + v.profile_id + " '" + v.name + "'>";
        });

    py::class_<Vox::VoiceOverrides>(m, "VoiceOverrides", "Profile fields to override (None keeps the base value)")
        .def(py::init<>())
        .def_readwrite("gender", &Vox::VoiceOverrides::gender)
        .def_readwrite("pitch", &Vox::VoiceOverrides::pitch)
        .def_readwrite("speed", &Vox::VoiceOverrides::speed)
        .def_readwrite("volume", &Vox::VoiceOverrides::volume)
        .def_readwrite("timbre", &Vox::VoiceOverrides::timbre)
        .def_readwrite("language", &Vox::VoiceOverrides::language)
        .def_readwrite("accent", &Vox::VoiceOverrides::accent)
        .def_readwrite("age_range", &Vox::VoiceOverrides::age_range)
        .def_readwrite("emotion_default", &Vox::VoiceOverrides::emotion_default)
        .def_readwrite("custom_params", &Vox::VoiceOverrides::custom_params, "JSON object text");

    py::class_<Vox::SpeakOptions>(m, "SpeakOptions", "Emotion, effect chain and text options")
        .def(py::init<>())
        .def_readwrite("emotion", &Vox::SpeakOptions::emotion)
        .def_readwrite("emotion_intensity", &Vox::SpeakOptions::emotion_intensity)
        .def_readwrite("effects", &Vox::SpeakOptions::effects,
            "Effect descriptors, e.g. 'reverb:room_size=0.6'")
        .def_readwrite("remove_punctuation", &Vox::SpeakOptions::remove_punctuation)
        .def_readwrite("lowercase", &Vox::SpeakOptions::lowercase);

    // =========================================================================
    // VoiceResult - 结果
    // =========================================================================

    py::class_<Vox::VoiceResult, std::shared_ptr<Vox::VoiceResult>>(
        m, "VoiceResult", "Audio or recognition result")
        .def("is_success", &Vox::VoiceResult::IsSuccess)
        .def("get_code", &Vox::VoiceResult::GetCode)
        .def("get_message", &Vox::VoiceResult::GetMessage)
        .def("get_errors", &Vox::VoiceResult::GetErrors)
        .def("get_effect_position", &Vox::VoiceResult::GetEffectPosition,
            "1-based position of the failing effect (0 if none)")
        .def("get_effect_kind", &Vox::VoiceResult::GetEffectKind)
        .def("get_field", &Vox::VoiceResult::GetField)
        .def("get_audio_data", [](const Vox::VoiceResult& r) {
            auto data = r.GetAudioData();
            return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
        }, "Get encoded audio bytes")
        .def("get_format", &Vox::VoiceResult::GetFormat)
        .def("get_sample_rate", &Vox::VoiceResult::GetSampleRate)
        .def("get_duration_ms", &Vox::VoiceResult::GetDurationMs)
        .def("get_history", &Vox::VoiceResult::GetHistory, "Processing steps in order")
        .def("get_text", &Vox::VoiceResult::GetText)
        .def("get_confidence", &Vox::VoiceResult::GetConfidence)
        .def("save_to_file", &Vox::VoiceResult::SaveToFile, py::arg("file_path"))
        .def("__bool__", &Vox::VoiceResult::IsSuccess)
        .def("__repr__", [](const Vox::VoiceResult& r) {
            return "<VoiceResult " + r.GetCode() +
                " duration=" + std::to_string(r.GetDurationMs()) + "ms>";
        });

    // =========================================================================
    // VoiceStudio - 主引擎
    // =========================================================================

    py::class_<Vox::VoiceStudio>(m, "VoiceStudio", "Voice customization engine")
        .def(py::init<const Vox::VoiceConfig&>(),
            py::arg("config") = Vox::VoiceConfig::Default())

        // 档案 (返回 (Status, VoiceInfo))
        .def("create_voice", [](Vox::VoiceStudio& self,
            const std::string& name,
            const std::string& base_preset,
            const Vox::VoiceOverrides& overrides) {
            Vox::VoiceInfo info;
            auto status = self.CreateVoice(name, base_preset, overrides, info);
            return std::make_pair(status, info);
        }, py::arg("name"), py::arg("base_preset") = "",
            py::arg("overrides") = Vox::VoiceOverrides())
        .def("update_voice", [](Vox::VoiceStudio& self,
            const std::string& profile_id,
            const Vox::VoiceOverrides& overrides) {
            Vox::VoiceInfo info;
            auto status = self.UpdateVoice(profile_id, overrides, info);
            return std::make_pair(status, info);
        }, py::arg("profile_id"), py::arg("overrides"))
        .def("get_voice", [](Vox::VoiceStudio& self, const std::string& profile_id) {
            Vox::VoiceInfo info;
            auto status = self.GetVoice(profile_id, info);
            return std::make_pair(status, info);
        }, py::arg("profile_id"))
        .def("list_voices", [](Vox::VoiceStudio& self) {
            std::vector<Vox::VoiceInfo> voices;
            auto status = self.ListVoices(voices);
            return std::make_pair(status, voices);
        })
        .def("delete_voice", &Vox::VoiceStudio::DeleteVoice, py::arg("profile_id"))
        .def_static("parse_overrides", [](const std::string& json_text) {
            Vox::VoiceOverrides overrides;
            auto status = Vox::VoiceStudio::ParseOverrides(json_text, overrides);
            return py::make_tuple(status, overrides);
        }, py::arg("json_text"), "Parse overrides from JSON text -> (Status, VoiceOverrides)")

        // 音频 - 释放 GIL
        .def("speak", [](Vox::VoiceStudio& self,
            const std::string& text,
            const std::string& profile_id,
            const Vox::SpeakOptions& options) {
            py::gil_scoped_release release;
            return self.Speak(text, profile_id, options);
        }, py::arg("text"), py::arg("profile_id"),
            py::arg("options") = Vox::SpeakOptions(),
            "Synthesize text with a saved voice (blocking, releases GIL)")
        .def("process", [](Vox::VoiceStudio& self,
            const std::string& input_path,
            const std::string& profile_id,
            const Vox::SpeakOptions& options) {
            py::gil_scoped_release release;
            return self.Process(input_path, profile_id, options);
        }, py::arg("input_path"), py::arg("profile_id"),
            py::arg("options") = Vox::SpeakOptions())
        .def("transform", [](Vox::VoiceStudio& self,
            const std::string& input_path,
            const std::string& preset) {
            py::gil_scoped_release release;
            return self.Transform(input_path, preset);
        }, py::arg("input_path"), py::arg("preset"))
        .def("transcribe", [](Vox::VoiceStudio& self,
            const std::string& input_path,
            const std::string& language) {
            py::gil_scoped_release release;
            return self.Transcribe(input_path, language);
        }, py::arg("input_path"), py::arg("language") = "")
        .def("export", [](Vox::VoiceStudio& self,
            const Vox::VoiceResult& result,
            const std::string& relative_path,
            bool overwrite) {
            std::string written;
            auto status = self.Export(result, relative_path, overwrite, written);
            return std::make_pair(status, written);
        }, py::arg("result"), py::arg("relative_path"), py::arg("overwrite") = false)

        // 查询
        .def("list_presets", &Vox::VoiceStudio::ListPresets)
        .def("list_emotions", &Vox::VoiceStudio::ListEmotions)
        .def("list_effects", &Vox::VoiceStudio::ListEffects)
        .def("list_transforms", &Vox::VoiceStudio::ListTransforms)
        .def_static("list_engines", &Vox::VoiceStudio::ListEngines)
        .def("get_config", &Vox::VoiceStudio::GetConfig)
        .def("is_initialized", &Vox::VoiceStudio::IsInitialized)
        .def("get_engine_name", &Vox::VoiceStudio::GetEngineName)

        .def("__repr__", [](const Vox::VoiceStudio& studio) {
            return "<VoiceStudio engine=" + studio.GetEngineName() +
                " initialized=" + (studio.IsInitialized() ? "true" : "false") + ">";
        });

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = "1.0.0";
}
